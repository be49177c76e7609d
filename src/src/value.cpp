#include <cjb/value.h>
#include "utf8.h"

#include <cjson/cJSON.h>

#include <climits>
#include <cmath>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace cjb {

namespace {
    Kind kind_of(const cJSON* n) {
        if (cJSON_IsNull(n)) return Kind::Null;
        if (cJSON_IsBool(n)) return Kind::Boolean;
        if (cJSON_IsNumber(n)) return Kind::Number;
        if (cJSON_IsString(n)) return Kind::String;
        if (cJSON_IsArray(n)) return Kind::Array;
        if (cJSON_IsObject(n)) return Kind::Object;
        if (cJSON_IsRaw(n)) return Kind::Raw;
        return Kind::Invalid;
    }

    [[noreturn]] void throw_mismatch(const char* expected, const cJSON* n) {
        std::ostringstream ss;
        ss << "expected " << expected << ", got " << kind_name(kind_of(n));
        throw TypeMismatch(ss.str());
    }

    void require_container(const cJSON* n, const char* op) {
        if (cJSON_IsArray(n) or cJSON_IsObject(n)) return;
        std::ostringstream ss;
        ss << op << ": expected array or object, got " << kind_name(kind_of(n));
        throw TypeMismatch(ss.str());
    }

    void require_array(const cJSON* n, const char* op) {
        if (cJSON_IsArray(n)) return;
        std::ostringstream ss;
        ss << op << ": expected array, got " << kind_name(kind_of(n));
        throw TypeMismatch(ss.str());
    }

    void require_object(const cJSON* n, const char* op) {
        if (cJSON_IsObject(n)) return;
        std::ostringstream ss;
        ss << op << ": expected object, got " << kind_name(kind_of(n));
        throw TypeMismatch(ss.str());
    }

    // cJSON indexes with int; anything at or past `limit` is out of range.
    int checked_index(std::size_t index, std::size_t limit, const char* op) {
        if (index >= limit or index > static_cast<std::size_t>(INT_MAX)) {
            std::ostringstream ss;
            ss << op << ": index " << index << " out of range (size: " << limit << ")";
            throw NotFound(ss.str());
        }
        return static_cast<int>(index);
    }

    void require_finite(double x) {
        if (not std::isfinite(x)) throw TypeMismatch("JSON numbers must be finite");
    }

    void require_json_string(std::string_view s) {
        if (s.find('\0') != std::string_view::npos)
            throw TypeMismatch("JSON strings cannot contain NUL bytes");
        if (not detail::is_valid_utf8(s)) throw TypeMismatch("JSON strings must be valid UTF-8");
    }

    // A root handed out as an owning Value never carries a member name.
    void clear_member_name(cJSON* n) {
        if (n->string == nullptr) return;
        if (not(n->type & cJSON_StringIsConst)) cJSON_free(n->string);
        n->string = nullptr;
        n->type &= ~cJSON_StringIsConst;
    }

    Value adopt(cJSON* n, const char* what) {
        if (n == nullptr) throw AllocationError(what);
        return Value(n);
    }

    std::string take_printed(char* printed, const char* what) {
        if (printed == nullptr) throw AllocationError(what);
        std::unique_ptr<char, void (*)(void*)> guard(printed, cJSON_free);
        return std::string(guard.get());
    }

    // Stored member names never contain NUL, so such a key matches nothing.
    cJSON* find_member(const cJSON* obj, std::string_view key, bool case_sensitive) {
        if (key.find('\0') != std::string_view::npos) return nullptr;
        const std::string k(key);
        return case_sensitive ? cJSON_GetObjectItemCaseSensitive(obj, k.c_str())
                              : cJSON_GetObjectItem(obj, k.c_str());
    }

    // An owning root attached somewhere inside its own subtree would form a cycle.
    void require_not_within(const cJSON* target, cJSON* root, const char* op) {
        std::vector<const cJSON*> pending{root};
        while (not pending.empty()) {
            const cJSON* n = pending.back();
            pending.pop_back();
            if (n == target) {
                std::ostringstream ss;
                ss << op << ": cannot attach a value inside itself";
                throw TypeMismatch(ss.str());
            }
            for (const cJSON* c = n->child; c != nullptr; c = c->next) pending.push_back(c);
        }
    }

    [[noreturn]] void throw_missing_key(std::string_view key) {
        std::ostringstream ss;
        ss << "key '" << key << "' not found";
        throw NotFound(ss.str());
    }
}  // namespace

// ValueRef::iterator

ValueRef::iterator& ValueRef::iterator::operator++() noexcept {
    if (node_ != nullptr) node_ = node_->next;
    return *this;
}

// ValueRef

cJSON* ValueRef::node() const {
    if (node_ == nullptr) throw std::logic_error("use of an empty or moved-from cjb::Value");
    return node_;
}

Kind ValueRef::kind() const { return kind_of(node()); }

bool ValueRef::as_bool() const {
    cJSON* n = node();
    if (not cJSON_IsBool(n)) throw_mismatch("boolean", n);
    return cJSON_IsTrue(n);
}

double ValueRef::as_double() const {
    cJSON* n = node();
    if (not cJSON_IsNumber(n)) throw_mismatch("number", n);
    return n->valuedouble;
}

std::int64_t ValueRef::as_int() const {
    cJSON* n = node();
    if (not cJSON_IsNumber(n)) throw_mismatch("number", n);
    double d = n->valuedouble;
    // [-2^63, 2^63) is exactly the range a double can convert from without overflow.
    if (not(d >= -9223372036854775808.0 and d < 9223372036854775808.0) or std::trunc(d) != d) {
        std::ostringstream ss;
        ss << "number " << d << " is not representable as a 64-bit integer";
        throw TypeMismatch(ss.str());
    }
    return static_cast<std::int64_t>(d);
}

std::string ValueRef::as_string() const {
    cJSON* n = node();
    const char* s = cJSON_GetStringValue(n);
    if (s == nullptr) throw_mismatch("string", n);
    return s;
}

std::string ValueRef::as_raw() const {
    cJSON* n = node();
    if (not cJSON_IsRaw(n) or n->valuestring == nullptr) throw_mismatch("raw", n);
    return n->valuestring;
}

std::size_t ValueRef::size() const {
    cJSON* n = node();
    require_container(n, "size");
    return static_cast<std::size_t>(cJSON_GetArraySize(n));
}

ValueRef ValueRef::at(std::size_t index) const {
    cJSON* n = node();
    require_container(n, "at");
    int i = checked_index(index, size(), "at");
    return ValueRef(cJSON_GetArrayItem(n, i));
}

ValueRef ValueRef::at(std::string_view key) const {
    auto found = find(key);
    if (not found) throw_missing_key(key);
    return *found;
}

std::optional<ValueRef> ValueRef::find(std::string_view key) const {
    cJSON* n = node();
    require_object(n, "find");
    cJSON* child = find_member(n, key, true);
    if (child == nullptr) return std::nullopt;
    return ValueRef(child);
}

std::optional<ValueRef> ValueRef::find_case_insensitive(std::string_view key) const {
    cJSON* n = node();
    require_object(n, "find_case_insensitive");
    cJSON* child = find_member(n, key, false);
    if (child == nullptr) return std::nullopt;
    return ValueRef(child);
}

std::vector<std::string> ValueRef::keys() const {
    cJSON* n = node();
    require_object(n, "keys");
    std::vector<std::string> out;
    for (cJSON* c = n->child; c != nullptr; c = c->next) out.emplace_back(c->string ? c->string : "");
    return out;
}

std::vector<std::pair<std::string, ValueRef> > ValueRef::items() const {
    cJSON* n = node();
    require_object(n, "items");
    std::vector<std::pair<std::string, ValueRef> > out;
    for (cJSON* c = n->child; c != nullptr; c = c->next)
        out.emplace_back(c->string ? c->string : "", ValueRef(c));
    return out;
}

std::string ValueRef::key() const {
    cJSON* n = node();
    if (n->string == nullptr) throw TypeMismatch("value is not an object member");
    return n->string;
}

ValueRef::iterator ValueRef::begin() const {
    cJSON* n = node();
    require_container(n, "iterate");
    return iterator(n->child);
}

void ValueRef::append(Value&& child) {
    cJSON* n = node();
    require_array(n, "append");
    require_not_within(n, child.node(), "append");
    if (not cJSON_AddItemToArray(n, child.handle()))
        throw TypeMismatch("append: cJSON refused the item");
    child.release();
}

void ValueRef::insert(std::size_t index, Value&& child) {
    cJSON* n = node();
    require_array(n, "insert");
    require_not_within(n, child.node(), "insert");
    // index == size() appends
    int i = checked_index(index, size() + 1, "insert");
    if (not cJSON_InsertItemInArray(n, i, child.handle()))
        throw TypeMismatch("insert: cJSON refused the item");
    child.release();
}

void ValueRef::replace(std::size_t index, Value&& child) {
    cJSON* n = node();
    require_array(n, "replace");
    require_not_within(n, child.node(), "replace");
    int i = checked_index(index, size(), "replace");
    if (not cJSON_ReplaceItemInArray(n, i, child.handle()))
        throw TypeMismatch("replace: cJSON refused the item");
    child.release();
}

void ValueRef::set(std::string_view key, Value&& child) {
    cJSON* n = node();
    require_object(n, "set");
    require_not_within(n, child.node(), "set");
    require_json_string(key);
    const std::string k(key);
    if (cJSON_GetObjectItemCaseSensitive(n, k.c_str()) == nullptr) {
        if (not cJSON_AddItemToObject(n, k.c_str(), child.handle()))
            throw AllocationError("set: member name");
    } else {
        if (not cJSON_ReplaceItemInObjectCaseSensitive(n, k.c_str(), child.handle()))
            throw AllocationError("set: member name");
    }
    child.release();
}

void ValueRef::add(std::string_view key, Value&& child) {
    cJSON* n = node();
    require_object(n, "add");
    require_not_within(n, child.node(), "add");
    require_json_string(key);
    const std::string k(key);
    if (not cJSON_AddItemToObject(n, k.c_str(), child.handle()))
        throw AllocationError("add: member name");
    child.release();
}

void ValueRef::erase(std::size_t index) {
    cJSON* n = node();
    require_array(n, "erase");
    cJSON_DeleteItemFromArray(n, checked_index(index, size(), "erase"));
}

void ValueRef::erase(std::string_view key) {
    cJSON* n = node();
    require_object(n, "erase");
    cJSON* child = find_member(n, key, true);
    if (child == nullptr) throw_missing_key(key);
    cJSON_Delete(cJSON_DetachItemViaPointer(n, child));
}

Value ValueRef::detach(std::size_t index) {
    cJSON* n = node();
    require_array(n, "detach");
    cJSON* child = cJSON_DetachItemFromArray(n, checked_index(index, size(), "detach"));
    return Value(child);
}

Value ValueRef::detach(std::string_view key) {
    cJSON* n = node();
    require_object(n, "detach");
    cJSON* child = find_member(n, key, true);
    if (child == nullptr) throw_missing_key(key);
    cJSON_DetachItemViaPointer(n, child);
    clear_member_name(child);
    return Value(child);
}

void ValueRef::set_number(double x) {
    cJSON* n = node();
    if (not cJSON_IsNumber(n)) throw_mismatch("number", n);
    require_finite(x);
    cJSON_SetNumberHelper(n, x);
}

void ValueRef::set_string(std::string_view s) {
    cJSON* n = node();
    if (not cJSON_IsString(n)) throw_mismatch("string", n);
    require_json_string(s);
    const std::string copy(s);
    if (cJSON_SetValuestring(n, copy.c_str()) == nullptr) throw AllocationError("set_string");
}

Value ValueRef::clone() const {
    Value copy = adopt(cJSON_Duplicate(node(), 1), "clone");
    clear_member_name(copy.handle());
    return copy;
}

bool ValueRef::equals(const ValueRef& other, bool case_sensitive) const {
    return cJSON_Compare(node(), other.node(), case_sensitive ? 1 : 0) != 0;
}

std::string ValueRef::dump(Format format) const {
    cJSON* n = node();
    char* printed = format == Format::Pretty ? cJSON_Print(n) : cJSON_PrintUnformatted(n);
    return take_printed(printed, "print");
}

std::string ValueRef::dump_buffered(int prebuffer, Format format) const {
    if (prebuffer < 0) throw TypeMismatch("dump_buffered: prebuffer must not be negative");
    char* printed = cJSON_PrintBuffered(node(), prebuffer, format == Format::Pretty ? 1 : 0);
    return take_printed(printed, "print");
}

// Value

Value::Value(cJSON* root) : ValueRef(root) {
    if (root == nullptr) throw AllocationError("cJSON node");
}

Value& Value::operator=(Value&& other) noexcept {
    if (this != &other) {
        cJSON_Delete(node_);
        node_ = other.release();
    }
    return *this;
}

Value::~Value() { cJSON_Delete(node_); }

Value Value::null() { return adopt(cJSON_CreateNull(), "null"); }

Value Value::boolean(bool b) { return adopt(cJSON_CreateBool(b ? 1 : 0), "boolean"); }

Value Value::number(double x) {
    require_finite(x);
    return adopt(cJSON_CreateNumber(x), "number");
}

Value Value::integer(std::int64_t n) {
    double d = static_cast<double>(n);
    // 2^63 rounds up from INT64_MAX and cannot be converted back
    if (d >= 9223372036854775808.0 or static_cast<std::int64_t>(d) != n) {
        std::ostringstream ss;
        ss << "integer " << n << " cannot be stored exactly in a JSON number";
        throw TypeMismatch(ss.str());
    }
    return adopt(cJSON_CreateNumber(d), "number");
}

Value Value::string(std::string_view s) {
    require_json_string(s);
    const std::string copy(s);
    return adopt(cJSON_CreateString(copy.c_str()), "string");
}

Value Value::raw(std::string_view json_text) {
    if (json_text.find('\0') != std::string_view::npos)
        throw TypeMismatch("raw JSON cannot contain NUL bytes");
    const std::string copy(json_text);
    return adopt(cJSON_CreateRaw(copy.c_str()), "raw");
}

Value Value::array() { return adopt(cJSON_CreateArray(), "array"); }

Value Value::object() { return adopt(cJSON_CreateObject(), "object"); }

Value Value::int_array(const std::vector<int>& v) {
    if (v.empty()) return array();
    if (v.size() > static_cast<std::size_t>(INT_MAX)) throw TypeMismatch("int_array: too many elements");
    return adopt(cJSON_CreateIntArray(v.data(), static_cast<int>(v.size())), "int_array");
}

Value Value::double_array(const std::vector<double>& v) {
    if (v.empty()) return array();
    if (v.size() > static_cast<std::size_t>(INT_MAX))
        throw TypeMismatch("double_array: too many elements");
    for (double x : v) require_finite(x);
    return adopt(cJSON_CreateDoubleArray(v.data(), static_cast<int>(v.size())), "double_array");
}

Value Value::string_array(const std::vector<std::string>& v) {
    if (v.empty()) return array();
    if (v.size() > static_cast<std::size_t>(INT_MAX))
        throw TypeMismatch("string_array: too many elements");
    std::vector<const char*> ptrs;
    ptrs.reserve(v.size());
    for (auto const& s : v) {
        require_json_string(s);
        ptrs.push_back(s.c_str());
    }
    return adopt(cJSON_CreateStringArray(ptrs.data(), static_cast<int>(ptrs.size())), "string_array");
}

}  // namespace cjb
