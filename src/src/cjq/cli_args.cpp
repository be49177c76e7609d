#include <cjb/cjq/cli_args.h>
#include <cjb/cjq/suggest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace cjb {
namespace cjq {

namespace {
    bool isHelpFlag(const std::string& arg) { return arg == "--help" or arg == "-h"; }
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2 or isHelpFlag(argv[1])) {
        action_ = Action::HELP;
        return;
    }

    filePath_ = argv[1];
    if (filePath_.size() > 1 and filePath_[0] == '-')
        throw std::invalid_argument("Expected a file path (or '-') before " + filePath_);

    action_ = Action::PRINT;

    static const std::vector<std::string> valid_options = {
                "--get", "-g", "--count", "--has", "--default", "-d",
                "--as-json", "--compact", "--verbose", "-v", "--help", "-h"};

    bool action_seen = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--get" or arg == "-g" or arg == "--count" or arg == "--has") {
            if (action_seen) throw std::invalid_argument("Only one of --get, --count, --has may be given");
            action_seen = true;
            Action a = (arg == "--count") ? Action::COUNT : (arg == "--has") ? Action::HAS : Action::GET;
            setAction(a, arg, i, argc, argv);
        } else if (arg == "--default" or arg == "-d") {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " requires a value argument");
            defaultValue_ = argv[++i];
        } else if (arg == "--as-json") {
            asJson_ = true;
        } else if (arg == "--compact") {
            compact_ = true;
        } else if (arg == "--verbose" or arg == "-v") {
            verbose_ = true;
        } else if (isHelpFlag(arg)) {
            action_ = Action::HELP;
            return;
        } else {
            throw std::invalid_argument(unknownOptionMessage(arg, valid_options));
        }
    }

    if (defaultValue_ and action_ != Action::GET)
        throw std::invalid_argument("--default only applies to --get");
}

void CliArgs::setAction(Action action, const std::string& flag, int& i, int argc, const char* argv[]) {
    if (i + 1 >= argc) throw std::invalid_argument(flag + " requires a path argument");
    action_ = action;
    path_ = argv[++i];
}

}  // namespace cjq
}  // namespace cjb
