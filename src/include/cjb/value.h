#pragma once

// C++ ownership layer over cJSON value trees.
//
// A Value owns a root cJSON node and deletes the whole subtree when it goes
// out of scope. A ValueRef is a non-owning view of any node, root or child.
// Views obtained from a tree are valid only while the owning Value is alive
// and the node has not been erased or detached; using a view after that is
// undefined behavior.
//
// A view cannot be made from a temporary Value, since it would dangle at
// once. Value derives from ValueRef, so assigning through a ValueRef&
// that refers to a Value replaces the owned handle without freeing it;
// never do that.
//
// Thread safety: none. cJSON trees are not safe for concurrent mutation, so
// a tree must not be touched from more than one thread without external
// locking. Concurrent reads of a tree nobody mutates are fine.

#include <cjb/error.h>
#include <cjb/kind.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct cJSON;

namespace cjb {

class Value;

enum class Format {
    Pretty,   // cJSON_Print: newlines and tab indentation
    Compact   // cJSON_PrintUnformatted
};

class ValueRef {
  public:
    class iterator {
      public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ValueRef;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = ValueRef;

        iterator() = default;
        explicit iterator(cJSON* node) noexcept : node_(node) {}

        ValueRef operator*() const noexcept { return ValueRef(node_); }
        iterator& operator++() noexcept;
        iterator operator++(int) noexcept {
            iterator prev = *this;
            ++(*this);
            return prev;
        }
        bool operator==(const iterator& rhs) const noexcept { return node_ == rhs.node_; }
        bool operator!=(const iterator& rhs) const noexcept { return node_ != rhs.node_; }

      private:
        cJSON* node_ = nullptr;
    };

    explicit ValueRef(cJSON* node) noexcept : node_(node) {}
    ValueRef(Value&&) = delete;
    ValueRef& operator=(Value&&) = delete;

    Kind kind() const;
    bool is_null() const { return kind() == Kind::Null; }
    bool is_bool() const { return kind() == Kind::Boolean; }
    bool is_number() const { return kind() == Kind::Number; }
    bool is_string() const { return kind() == Kind::String; }
    bool is_array() const { return kind() == Kind::Array; }
    bool is_object() const { return kind() == Kind::Object; }
    bool is_raw() const { return kind() == Kind::Raw; }
    bool is_container() const { return is_array() or is_object(); }

    // Scalar extraction. Throws TypeMismatch when the kind differs.
    bool as_bool() const;
    double as_double() const;
    // Only for numbers holding an integral value inside the int64 range.
    std::int64_t as_int() const;
    std::string as_string() const;
    std::string as_raw() const;

    // Number of children. Throws TypeMismatch for scalars.
    std::size_t size() const;
    bool empty() const { return size() == 0; }

    // Child access. Keys are compared case-sensitively.
    ValueRef at(std::size_t index) const;
    ValueRef at(std::string_view key) const;
    std::optional<ValueRef> find(std::string_view key) const;
    // cJSON's historical lookup, which ignores ASCII case.
    std::optional<ValueRef> find_case_insensitive(std::string_view key) const;
    bool has(std::string_view key) const { return find(key).has_value(); }

    std::vector<std::string> keys() const;
    std::vector<std::pair<std::string, ValueRef> > items() const;

    // Member name of an object child. Throws TypeMismatch if the node has none.
    std::string key() const;

    iterator begin() const;
    iterator end() const { return iterator(); }

    // Container mutation. Each inserting call takes ownership of `child`;
    // if cJSON refuses the insertion, `child` keeps its subtree.
    void append(Value&& child);
    void insert(std::size_t index, Value&& child);
    void replace(std::size_t index, Value&& child);
    // Replaces the first member named `key`, or adds one.
    void set(std::string_view key, Value&& child);
    // Always adds a member, even if `key` is already present.
    void add(std::string_view key, Value&& child);

    void erase(std::size_t index);
    void erase(std::string_view key);

    Value detach(std::size_t index);
    Value detach(std::string_view key);

    void set_number(double x);
    void set_string(std::string_view s);

    Value clone() const;
    bool equals(const ValueRef& other, bool case_sensitive = true) const;

    std::string dump(Format format = Format::Pretty) const;
    // Same output as dump(); `prebuffer` is cJSON's initial buffer guess.
    std::string dump_buffered(int prebuffer, Format format = Format::Pretty) const;

    cJSON* handle() const noexcept { return node_; }

  protected:
    cJSON* node() const;

    cJSON* node_ = nullptr;
};

inline bool operator==(const ValueRef& lhs, const ValueRef& rhs) { return lhs.equals(rhs); }
inline bool operator!=(const ValueRef& lhs, const ValueRef& rhs) { return not lhs.equals(rhs); }

// Exclusive owner of a root cJSON node. Move-only.
class Value : public ValueRef {
  public:
    static Value null();
    static Value boolean(bool b);
    // Throws TypeMismatch for NaN and infinities.
    static Value number(double x);
    // Throws TypeMismatch if `n` is not exactly representable as a double.
    static Value integer(std::int64_t n);
    // Throws TypeMismatch for invalid UTF-8 or embedded NUL bytes.
    static Value string(std::string_view s);
    // Pre-serialized JSON emitted verbatim when printing. Not validated.
    static Value raw(std::string_view json_text);
    static Value array();
    static Value object();

    static Value int_array(const std::vector<int>& v);
    static Value double_array(const std::vector<double>& v);
    static Value string_array(const std::vector<std::string>& v);

    // Takes ownership of a detached root node; nullptr is an AllocationError.
    explicit Value(cJSON* root);

    Value(Value&& other) noexcept : ValueRef(other.release()) {}
    Value& operator=(Value&& other) noexcept;
    Value(const Value&) = delete;
    Value& operator=(const Value&) = delete;
    ~Value();

    // Gives up ownership without freeing. The caller must cJSON_Delete it.
    cJSON* release() noexcept {
        cJSON* n = node_;
        node_ = nullptr;
        return n;
    }
};

}  // namespace cjb
