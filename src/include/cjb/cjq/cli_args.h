#pragma once

#include <optional>
#include <string>

namespace cjb {
namespace cjq {

// Command line of the cjq tool:
//   cjq <file|-> [--get <path> | --count <path> | --has <path>]
//       [--default <value>] [--as-json] [--compact] [--verbose]
// Throws std::invalid_argument on malformed input.
class CliArgs {
  public:
    enum class Action {
        HELP,   // Show help message
        PRINT,  // Print the whole document (default)
        GET,    // Print the value at a path
        COUNT,  // Number of children at a path
        HAS     // Exit status tells whether a path exists
    };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::string& getFilePath() const { return filePath_; }
    bool readsStdin() const { return filePath_ == "-"; }
    const std::string& getPath() const { return path_; }
    bool hasDefault() const { return defaultValue_.has_value(); }
    const std::string& getDefault() const { return *defaultValue_; }
    bool outputAsJson() const { return asJson_; }
    bool compact() const { return compact_; }
    bool verbose() const { return verbose_; }

  private:
    void setAction(Action action, const std::string& flag, int& i, int argc, const char* argv[]);

    Action action_ = Action::HELP;
    std::string filePath_;
    std::string path_;
    std::optional<std::string> defaultValue_;
    bool asJson_ = false;
    bool compact_ = false;
    bool verbose_ = false;
};

}  // namespace cjq
}  // namespace cjb
