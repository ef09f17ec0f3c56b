#pragma once

#include "tree/cluster_node.hpp"
#include <cmath>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace cv {

/**
 * @brief Bad command line: unknown option, missing value or a value of the wrong kind
 */
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// What an option's value must look like; checked while parsing
enum class OptionKind {
    Flag,       // No value, presence means true
    Text,
    Path,
    Node,       // One node id
    NodeList,   // Comma-separated node ids, e.g. a focus sequence
    Count,      // Non-negative integer
    Seconds     // Non-negative, finite
};

inline NodeId parse_node_id(const std::string& text) {
    size_t used = 0;
    long long id = 0;
    try {
        id = std::stoll(text, &used);
    } catch (const std::logic_error&) {
        throw UsageError("Invalid node id: '" + text + "'");
    }
    if (used != text.size()) {
        throw UsageError("Invalid node id: '" + text + "'");
    }
    return static_cast<NodeId>(id);
}

inline std::vector<NodeId> parse_node_list(const std::string& text) {
    std::vector<NodeId> ids;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string item = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        if (!item.empty()) {
            ids.push_back(parse_node_id(item));
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return ids;
}

struct Option {
    std::string name;
    char short_name = 0;
    OptionKind kind = OptionKind::Text;
    std::string description;
    std::string default_value;
    bool required = false;
};

/**
 * @brief Options every command that reads cluster data accepts
 */
inline std::vector<Option> data_source_options() {
    return {
        {"tree", 't', OptionKind::Path, "Cluster tree JSON file (omit to use the HTTP API)", "", false},
        {"config", 'c', OptionKind::Path, "Path to config file (optional)", "", false},
        {"namespace", 'n', OptionKind::Text, "Dataset namespace", "", false},
        {"api", 'a', OptionKind::Text, "API base URL", "", false},
        {"verbose", 'v', OptionKind::Flag, "Verbose logging", "", false}
    };
}

/**
 * @brief Option values of one invocation, already checked against their kinds
 */
class ParsedOptions {
public:
    bool has(const std::string& name) const { return values_.count(name) > 0; }

    std::string text(const std::string& name) const {
        auto it = values_.find(name);
        return it == values_.end() ? std::string() : it->second;
    }

    NodeId node(const std::string& name) const { return parse_node_id(at(name)); }

    std::vector<NodeId> nodes(const std::string& name) const {
        return has(name) ? parse_node_list(values_.at(name)) : std::vector<NodeId>{};
    }

    int count(const std::string& name) const { return has(name) ? std::stoi(values_.at(name)) : 0; }

    double seconds(const std::string& name) const {
        return has(name) ? std::stod(values_.at(name)) : 0.0;
    }

    void set(const std::string& name, const std::string& value) { values_[name] = value; }

private:
    std::map<std::string, std::string> values_;

    const std::string& at(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            throw UsageError("Missing required option: --" + name);
        }
        return it->second;
    }
};

struct Subcommand {
    std::string name;
    std::string summary;
    std::vector<Option> options;
    std::function<int(const ParsedOptions&)> handler;
};

class CommandLine {
public:
    CommandLine(std::string program, std::string version)
        : program_(std::move(program)), version_(std::move(version)) {}

    void add(Subcommand command) {
        std::string name = command.name;
        commands_[name] = std::move(command);
    }

    /**
     * @brief Dispatch argv[1] to its subcommand
     *
     * @return Handler exit code; 1 for usage errors and uncaught failures
     */
    int run(int argc, char** argv) const {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string name = argv[1];
        if (name == "--help" || name == "-h") {
            print_usage();
            return 0;
        }
        if (name == "--version") {
            std::cout << program_ << " " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(name);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << name << "\n";
            print_usage();
            return 1;
        }
        const Subcommand& command = it->second;

        std::vector<std::string> words(argv + 2, argv + argc);
        for (const auto& word : words) {
            if (word == "--help" || word == "-h") {
                print_usage(command);
                return 0;
            }
        }

        ParsedOptions options;
        try {
            options = parse(command, words);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            print_usage(command);
            return 1;
        }

        try {
            return command.handler(options);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    /**
     * @brief Match words against the command's options and validate each value
     *
     * Accepts --name value, --name=value and -x value. Positional words are rejected.
     */
    static ParsedOptions parse(const Subcommand& command, const std::vector<std::string>& words) {
        ParsedOptions result;

        for (size_t i = 0; i < words.size(); ++i) {
            const std::string& word = words[i];
            std::string inline_value;
            bool has_inline = false;
            const Option* option = nullptr;

            if (word.rfind("--", 0) == 0) {
                std::string name = word.substr(2);
                auto eq = name.find('=');
                if (eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name = name.substr(0, eq);
                    has_inline = true;
                }
                option = find(command, name);
            } else if (word.size() == 2 && word[0] == '-') {
                option = find(command, word[1]);
            } else {
                throw UsageError("Unexpected argument: " + word);
            }

            if (!option) {
                throw UsageError("Unknown option: " + word);
            }

            if (option->kind == OptionKind::Flag) {
                if (has_inline) {
                    throw UsageError("Option --" + option->name + " takes no value");
                }
                result.set(option->name, "true");
                continue;
            }

            if (!has_inline) {
                if (i + 1 >= words.size()) {
                    throw UsageError("Option --" + option->name + " requires a value");
                }
                inline_value = words[++i];
            }
            check_value(*option, inline_value);
            result.set(option->name, inline_value);
        }

        for (const auto& option : command.options) {
            if (result.has(option.name)) continue;
            if (option.required) {
                throw UsageError("Missing required option: --" + option.name);
            }
            if (!option.default_value.empty()) {
                result.set(option.name, option.default_value);
            }
        }
        return result;
    }

    void print_usage() const {
        std::cout << program_ << " - Cluster tree scene navigator\n\n";
        std::cout << "Usage: " << program_ << " <command> [options]\n\nCommands:\n";
        for (const auto& [name, command] : commands_) {
            std::cout << "  " << name << std::string(name.size() < 12 ? 12 - name.size() : 1, ' ')
                      << command.summary << "\n";
        }
        std::cout << "\nRun '" << program_ << " <command> --help' for its options.\n";
    }

    void print_usage(const Subcommand& command) const {
        std::cout << "\nUsage: " << program_ << " " << command.name << " [options]\n\n";
        std::cout << command.summary << "\n\nOptions:\n";
        for (const auto& option : command.options) {
            std::cout << "  --" << option.name;
            if (option.short_name) {
                std::cout << ", -" << option.short_name;
            }
            std::cout << value_hint(option.kind) << "\n      " << option.description;
            if (!option.default_value.empty()) {
                std::cout << " (default: " << option.default_value << ")";
            }
            if (option.required) {
                std::cout << " [required]";
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }

private:
    std::string program_;
    std::string version_;
    std::map<std::string, Subcommand> commands_;

    static const Option* find(const Subcommand& command, const std::string& name) {
        for (const auto& option : command.options) {
            if (option.name == name) return &option;
        }
        return nullptr;
    }

    static const Option* find(const Subcommand& command, char short_name) {
        for (const auto& option : command.options) {
            if (option.short_name == short_name) return &option;
        }
        return nullptr;
    }

    static const char* value_hint(OptionKind kind) {
        switch (kind) {
            case OptionKind::Flag: return "";
            case OptionKind::Path: return " <file>";
            case OptionKind::Node: return " <id>";
            case OptionKind::NodeList: return " <id,id,...>";
            case OptionKind::Count: return " <n>";
            case OptionKind::Seconds: return " <seconds>";
            case OptionKind::Text: break;
        }
        return " <value>";
    }

    static void check_value(const Option& option, const std::string& value) {
        const std::string where = "--" + option.name + ": ";
        switch (option.kind) {
            case OptionKind::Node:
                parse_node_id(value);
                break;
            case OptionKind::NodeList:
                if (parse_node_list(value).empty()) {
                    throw UsageError(where + "expected at least one node id");
                }
                break;
            case OptionKind::Count: {
                size_t used = 0;
                int n = -1;
                try {
                    n = std::stoi(value, &used);
                } catch (const std::logic_error&) {
                    used = 0;
                }
                if (used != value.size() || n < 0) {
                    throw UsageError(where + "expected a non-negative integer, got '" + value + "'");
                }
                break;
            }
            case OptionKind::Seconds: {
                size_t used = 0;
                double s = -1.0;
                try {
                    s = std::stod(value, &used);
                } catch (const std::logic_error&) {
                    used = 0;
                }
                if (used != value.size() || !std::isfinite(s) || s < 0.0) {
                    throw UsageError(where + "expected a non-negative number of seconds, got '" + value + "'");
                }
                break;
            }
            case OptionKind::Path:
            case OptionKind::Text:
                if (value.empty()) {
                    throw UsageError(where + "empty value");
                }
                break;
            case OptionKind::Flag:
                break;
        }
    }
};

} // namespace cv
