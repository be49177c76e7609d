#pragma once

#include <cjb/value.h>

#include <string>
#include <vector>

namespace cjb {
namespace cjq {

// Renders query results for the terminal.
class OutputFormatter {
  public:
    explicit OutputFormatter(Format format = Format::Compact) : format_(format) {}

    // Scalars without JSON quoting (shell friendly); containers as JSON.
    std::string formatRaw(ValueRef value) const;
    // One raw value per line.
    std::string formatRaw(const std::vector<ValueRef>& values) const;

    std::string formatJson(ValueRef value) const;
    // Results gathered into a single JSON array.
    std::string formatJson(const std::vector<ValueRef>& values) const;

  private:
    Format format_;
};

}  // namespace cjq
}  // namespace cjb
