#include "../../include/command_spec.hpp"

#include <algorithm>

namespace vidtool {

std::vector<std::string> CommandSpec::to_arguments() const {
    std::vector<std::string> args;
    args.reserve(input_flags.size() + output_flags.size() + 6);
    args.emplace_back("-hide_banner");
    args.emplace_back(overwrite ? "-y" : "-n");
    args.insert(args.end(), input_flags.begin(), input_flags.end());
    args.emplace_back("-i");
    args.push_back(input.string());
    args.insert(args.end(), output_flags.begin(), output_flags.end());
    args.push_back(output.string());
    return args;
}

CommandSpec CommandSpec::with_output(std::filesystem::path path) const {
    CommandSpec copy = *this;
    copy.output = std::move(path);
    return copy;
}

std::string CommandSpec::to_display_string(const std::string_view program) const {
    std::string out = shell_quote(program);
    for (const auto& arg : to_arguments()) {
        out += ' ';
        out += shell_quote(arg);
    }
    return out;
}

std::string shell_quote(const std::string_view arg) {
    const bool safe = !arg.empty() && std::ranges::all_of(arg, [](const char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
            || c == '-' || c == '_' || c == '.' || c == '/' || c == ':' || c == '='
            || c == ',' || c == '+' || c == '@' || c == '%';
    });
    if (safe) return std::string(arg);

    std::string out = "'";
    for (const char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

} // namespace vidtool
