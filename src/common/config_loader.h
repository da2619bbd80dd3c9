#ifndef GF256_CONFIG_LOADER_H
#define GF256_CONFIG_LOADER_H

#include "types.h"
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gf256 {
namespace config {

/**
 * YAML Configuration File Parser
 * Lightweight implementation without yaml-cpp (minimize external dependencies)
 *
 * Supported formats:
 * - Simple key: value
 * - Nested sections (section:), flattened to dotted keys (section.key)
 * - Comments (# comment), whole-line or trailing
 * - Double-quoted values
 */
class SimpleYAMLParser {
private:
    std::map<std::string, std::string> values_;
    // (indent, name) of every open section, outermost first
    std::vector<std::pair<size_t, std::string>> section_stack_;

public:
    bool parseFile(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            std::cerr << "[ConfigLoader] Failed to open: " << filepath << "\n";
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            parseLine(line);
        }
        return true;
    }

    void parseString(const std::string& text) {
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string::npos) end = text.size();
            parseLine(text.substr(start, end - start));
            start = end + 1;
        }
    }

    std::optional<std::string> getString(const std::string& key) const {
        auto it = values_.find(key);
        if (it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<bool> getBool(const std::string& key) const {
        auto str = getString(key);
        if (str.has_value()) {
            std::string lower = *str;
            for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (lower == "true" || lower == "yes" || lower == "1") return true;
            if (lower == "false" || lower == "no" || lower == "0") return false;
        }
        return std::nullopt;
    }

    void dump() const {
        std::cout << "[ConfigLoader] Loaded values:\n";
        for (const auto& [key, value] : values_) {
            std::cout << "  " << key << " = " << value << "\n";
        }
    }

private:
    void parseLine(std::string line) {
        // Strip trailing comment (not inside quotes)
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') quoted = !quoted;
            if (line[i] == '#' && !quoted) {
                line.erase(i);
                break;
            }
        }

        size_t indent = 0;
        while (indent < line.size() && std::isspace(static_cast<unsigned char>(line[indent]))) {
            indent++;
        }

        line = trim(line);
        if (line.empty()) return;

        // Skip list items (- item)
        if (line[0] == '-') return;

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) return;

        // Close sections at the same or deeper indentation
        while (!section_stack_.empty() && section_stack_.back().first >= indent) {
            section_stack_.pop_back();
        }

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        if (value.empty()) {
            section_stack_.emplace_back(indent, key);
            return;
        }

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        std::string full_key;
        for (const auto& section : section_stack_) {
            full_key += section.second + ".";
        }
        full_key += key;

        values_[full_key] = value;
    }

    static std::string trim(const std::string& str) {
        size_t start = 0;
        while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) start++;

        size_t end = str.size();
        while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) end--;

        return str.substr(start, end - start);
    }
};

/**
 * Parse a field element literal: decimal (0..255) or hex with 0x prefix.
 *
 * @throws std::invalid_argument on anything else
 */
inline uint8_t parseByte(const std::string& text) {
    std::string digits = text;
    int base = 10;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
        base = 16;
    }

    bool valid = !digits.empty();
    for (char c : digits) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!(base == 16 ? std::isxdigit(uc) : std::isdigit(uc))) {
            valid = false;
            break;
        }
    }
    // Keeps stoul from overflowing
    if (!valid || digits.size() > 8) {
        throw std::invalid_argument("Not a byte value: '" + text + "'");
    }

    unsigned long value = std::stoul(digits, nullptr, base);
    if (value >= FIELD_SIZE) {
        throw std::invalid_argument("Byte value out of range 0..255: '" + text + "'");
    }
    return static_cast<uint8_t>(value);
}

/**
 * Demo Configuration
 *
 * demo:
 *   a: 3
 *   b: 4
 *   self_test: false
 */
struct DemoConfig {
    uint8_t a = 3;
    uint8_t b = 4;
    bool self_test = false;

    /**
     * Apply values from an already parsed YAML document
     */
    void apply(const SimpleYAMLParser& parser) {
        if (auto v = parser.getString("demo.a")) a = parseByte(*v);
        if (auto v = parser.getString("demo.b")) b = parseByte(*v);
        if (auto v = parser.getString("demo.self_test")) {
            auto flag = parser.getBool("demo.self_test");
            if (!flag) {
                throw std::invalid_argument("demo.self_test must be a boolean, got '" + *v + "'");
            }
            self_test = *flag;
        }
    }

    /**
     * Load configuration from YAML file
     *
     * @throws std::invalid_argument if the file cannot be read or holds a bad value
     */
    void loadFromFile(const std::string& filepath) {
        SimpleYAMLParser parser;
        if (!parser.parseFile(filepath)) {
            throw std::invalid_argument("Cannot read configuration file: " + filepath);
        }

        std::cout << "[ConfigLoader] Loading configuration from: " << filepath << "\n";
        parser.dump();
        apply(parser);
        std::cout << "[ConfigLoader] ✓ Configuration loaded successfully\n";
    }

    /**
     * Override configuration with CLI arguments
     *
     * --config <file> is consumed by the caller and skipped here.
     *
     * @throws std::invalid_argument for a missing or malformed operand
     */
    void applyCommandLineOverrides(int argc, char** argv) {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--config") {
                ++i;
            }
            else if (arg == "--a" || arg == "--b") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                uint8_t value = parseByte(argv[++i]);
                (arg == "--a" ? a : b) = value;
                std::cout << "[ConfigLoader] Override: " << arg.substr(2) << " = "
                          << static_cast<int>(value) << "\n";
            }
            else if (arg == "--self-test") {
                self_test = true;
                std::cout << "[ConfigLoader] Override: self-test enabled\n";
            }
            else {
                std::cerr << "[ConfigLoader] Ignoring unknown argument: " << arg << "\n";
            }
        }
    }
};

} // namespace config
} // namespace gf256

#endif // GF256_CONFIG_LOADER_H
