#include "engine/command_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace gitty {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string word;
    while (iss >> word) words.push_back(word);
    return words;
}

// Text after "-m": a quoted string up to the matching quote, or the rest
// of the line. Falls back to "Commit".
std::string extractMessage(const std::string& line) {
    size_t pos = 0;
    while ((pos = line.find("-m", pos)) != std::string::npos) {
        bool starts_word = pos == 0 || std::isspace(static_cast<unsigned char>(line[pos - 1]));
        bool ends_word = pos + 2 == line.size() || std::isspace(static_cast<unsigned char>(line[pos + 2]));
        if (starts_word && ends_word) break;
        pos += 2;
    }
    if (pos == std::string::npos) return "Commit";

    std::string rest = trim(line.substr(pos + 2));
    if (rest.empty()) return "Commit";

    char quote = rest.front();
    if (quote == '"' || quote == '\'') {
        auto close = rest.find(quote, 1);
        if (close != std::string::npos && close > 1) {
            return rest.substr(1, close - 1);
        }
        rest = trim(rest.substr(1));
        if (!rest.empty() && rest.back() == quote) rest.pop_back();
    }
    return rest.empty() ? "Commit" : rest;
}

} // namespace

std::optional<Command> parseCommandString(const std::string& input) {
    std::string line = trim(input);
    if (lower(line.substr(0, 4)) == "git ") {
        line = trim(line.substr(4));
    }

    auto words = splitWords(line);
    if (words.empty()) return std::nullopt;

    const std::string cmd = lower(words[0]);
    const std::string arg = words.size() > 1 ? words[1] : std::string();

    if (cmd == "commit" || cmd == "ci") {
        return Command::commit(extractMessage(line));
    }
    if (cmd == "undo") {
        return Command::undo();
    }
    if (arg.empty()) return std::nullopt;

    if (cmd == "branch" || cmd == "br") {
        if (!isValidBranchName(arg)) return std::nullopt;
        return Command::branch(arg);
    }
    if (cmd == "checkout" || cmd == "co") return Command::checkout(arg);
    if (cmd == "merge" || cmd == "mg") return Command::merge(arg);
    if (cmd == "rebase" || cmd == "rb") return Command::rebase(arg);
    return std::nullopt;
}

bool isValidBranchName(const std::string& name) {
    if (name.empty() || name.size() > 50) return false;
    if (name.front() == '.' || name.front() == '-' || name.back() == '.') return false;
    if (name.find("..") != std::string::npos) return false;
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) return false;
        if (c == '@' || c == '{' || c == '}' || c == '[' || c == ']' || c == '\\') return false;
    }
    return true;
}

} // namespace gitty
