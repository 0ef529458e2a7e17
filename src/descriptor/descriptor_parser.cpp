#include "descriptor/descriptor_parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/build_error.hpp"
#include "common/logging.hpp"

namespace stratum {

namespace {

constexpr char kDefaultEscape = '\\';

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string rtrim(const std::string &value)
{
    size_t end = value.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(0, end);
}

std::string toUpper(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::vector<std::string> splitWords(const std::string &value)
{
    std::vector<std::string> words;
    std::istringstream stream(value);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

[[noreturn]] void parseError(const std::string &sourceName, int line,
                             const std::string &message)
{
    std::ostringstream out;
    out << sourceName << ":" << line << ": " << message;
    throw BuildError(BuildErrorKind::Parse, out.str(), 2, line);
}

bool isWordStart(const std::string &text, size_t i)
{
    return i == 0 || std::isspace(static_cast<unsigned char>(text[i - 1]));
}

bool isWordEnd(const std::string &text, size_t i)
{
    return i + 1 >= text.size()
        || std::isspace(static_cast<unsigned char>(text[i + 1]));
}

struct LogicalLine {
    int line = 0;
    std::string text;
    bool comment = false;
};

// Consumes "# escape=x" directives at the very top of the file.
char readEscapeDirective(const std::vector<std::string> &lines, size_t &firstLine,
                         const std::string &sourceName)
{
    static const std::regex directive(R"(^#\s*([A-Za-z]+)\s*=\s*(\S*)\s*$)");

    char escape = kDefaultEscape;
    firstLine = 0;
    while (firstLine < lines.size()) {
        std::smatch match;
        if (!std::regex_match(lines[firstLine], match, directive)) {
            break;
        }
        const std::string key = toUpper(match[1].str());
        if (key != "ESCAPE") {
            break;
        }
        const std::string value = match[2].str();
        if (value != "\\" && value != "`") {
            parseError(sourceName, static_cast<int>(firstLine) + 1,
                       "invalid escape token '" + value + "', must be \\ or `");
        }
        escape = value[0];
        ++firstLine;
    }
    return escape;
}

std::vector<LogicalLine> joinLogicalLines(const std::string &text,
                                          const std::string &sourceName)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string raw;
    while (std::getline(stream, raw)) {
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        lines.push_back(raw);
    }

    size_t firstLine = 0;
    const char escape = readEscapeDirective(lines, firstLine, sourceName);

    std::vector<LogicalLine> logical;
    bool inContinuation = false;
    LogicalLine current;

    for (size_t i = firstLine; i < lines.size(); ++i) {
        const int lineNumber = static_cast<int>(i) + 1;
        const std::string trimmed = trim(lines[i]);

        if (trimmed.empty()) {
            continue;
        }
        if (trimmed.front() == '#') {
            // Comments inside a continuation are dropped, like blank lines.
            if (!inContinuation) {
                LogicalLine comment;
                comment.line = lineNumber;
                comment.text = trim(trimmed.substr(1));
                comment.comment = true;
                logical.push_back(std::move(comment));
            }
            continue;
        }

        if (!inContinuation) {
            current = LogicalLine{};
            current.line = lineNumber;
        }

        const std::string content = rtrim(lines[i]);
        if (content.back() == escape) {
            current.text += content.substr(0, content.size() - 1);
            inContinuation = true;
            continue;
        }

        current.text += content;
        current.text = trim(current.text);
        logical.push_back(std::move(current));
        inContinuation = false;
    }

    if (inContinuation) {
        parseError(sourceName, current.line,
                   "unexpected end of file after line continuation");
    }

    return logical;
}

// Exec form: a JSON array of strings. Anything that is not JSON is shell form.
std::optional<std::string> execFormCommand(const std::string &rest,
                                           const std::string &sourceName, int line)
{
    if (rest.empty() || rest.front() != '[') {
        return std::nullopt;
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(rest);
    } catch (const nlohmann::json::parse_error &) {
        return std::nullopt;
    }

    if (!parsed.is_array() || parsed.empty()) {
        parseError(sourceName, line, "exec form RUN needs a non-empty array of strings");
    }

    std::string command;
    for (const auto &argument : parsed) {
        if (!argument.is_string()) {
            parseError(sourceName, line, "exec form RUN needs a non-empty array of strings");
        }
        if (!command.empty()) {
            command += ' ';
        }
        command += shellQuote(argument.get<std::string>());
    }
    return command;
}

} // namespace

std::vector<std::string> splitCompoundCommand(const std::string &command)
{
    const std::string text = trim(command);
    std::vector<std::string> parts;
    std::string current;
    bool splittable = true;
    bool inSingle = false;
    bool inDouble = false;
    int depth = 0;

    for (size_t i = 0; i < text.size() && splittable; ++i) {
        const char c = text[i];
        const char next = i + 1 < text.size() ? text[i + 1] : '\0';

        if (inSingle) {
            current += c;
            if (c == '\'') {
                inSingle = false;
            }
            continue;
        }

        if (c == '\\' && next != '\0') {
            current += c;
            current += next;
            ++i;
            continue;
        }

        if (inDouble) {
            current += c;
            if (c == '"') {
                inDouble = false;
            } else if (c == '`' || (c == '$' && next == '(')) {
                // Nested quoting inside substitutions is not tracked.
                splittable = false;
            }
            continue;
        }

        switch (c) {
        case '\'':
            inSingle = true;
            break;
        case '"':
            inDouble = true;
            break;
        case '`':
        case '\n':
            splittable = false;
            break;
        case ';':
            if (depth == 0) {
                splittable = false;
            }
            break;
        case '(':
            ++depth;
            break;
        case ')':
            --depth;
            break;
        case '#':
            if (depth == 0 && isWordStart(text, i)) {
                splittable = false;
            }
            break;
        case '{':
        case '}':
            if (depth == 0 && isWordStart(text, i) && isWordEnd(text, i)) {
                splittable = false;
            }
            break;
        case '[':
            // [[ ... ]] has its own && operator.
            if (next == '[' && isWordStart(text, i)) {
                splittable = false;
            }
            break;
        case '<':
            if (next == '<') {
                splittable = false;
            }
            break;
        case '|':
            if (depth == 0 && next == '|') {
                splittable = false;
            }
            break;
        case '&':
            if (depth > 0) {
                break;
            }
            if (next == '&') {
                parts.push_back(trim(current));
                current.clear();
                ++i;
                continue;
            }
            // Redirections such as 2>&1 and &> are not list operators.
            if (next != '>' && (i == 0 || (text[i - 1] != '>' && text[i - 1] != '<'))) {
                splittable = false;
            }
            break;
        default:
            break;
        }

        current += c;
    }

    parts.push_back(trim(current));

    const bool hasEmptyOperand = std::any_of(parts.begin(), parts.end(),
                                             [](const std::string &part) {
                                                 return part.empty();
                                             });
    if (!splittable || inSingle || inDouble || depth != 0 || hasEmptyOperand) {
        return {text};
    }
    return parts;
}

std::string shellQuote(const std::string &argument)
{
    static const std::regex safe(R"(^[A-Za-z0-9_@%+=:,./-]+$)");
    if (std::regex_match(argument, safe)) {
        return argument;
    }

    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

bool isValidImageReference(const std::string &reference)
{
    static const std::regex pattern(
        R"(^[A-Za-z0-9][A-Za-z0-9._\-/]*(:[A-Za-z0-9_][A-Za-z0-9._\-]*)?(@[A-Za-z0-9]+:[A-Fa-f0-9]+)?$)");
    if (reference.find("//") != std::string::npos) {
        return false;
    }
    if (std::regex_match(reference, pattern)) {
        return true;
    }
    // Registry with a port: host:port/repo[:tag]
    static const std::regex withPort(
        R"(^[A-Za-z0-9][A-Za-z0-9.\-]*:[0-9]+/[A-Za-z0-9][A-Za-z0-9._\-/]*(:[A-Za-z0-9_][A-Za-z0-9._\-]*)?(@[A-Za-z0-9]+:[A-Fa-f0-9]+)?$)");
    return std::regex_match(reference, withPort);
}

std::string normalizeImageReference(const std::string &reference)
{
    const std::string value = trim(reference);
    if (value.empty() || value.find('@') != std::string::npos) {
        return value;
    }

    const size_t lastSlash = value.rfind('/');
    const size_t lastColon = value.rfind(':');
    if (lastColon == std::string::npos
        || (lastSlash != std::string::npos && lastColon < lastSlash)) {
        return value + ":latest";
    }
    return value;
}

Descriptor parseDescriptor(const std::string &text, const std::string &sourceName)
{
    Descriptor descriptor;
    descriptor.sourceName = sourceName;

    bool seenFrom = false;
    for (const LogicalLine &logical : joinLogicalLines(text, sourceName)) {
        if (logical.comment) {
            Step step;
            step.kind = StepKind::Comment;
            step.payload = logical.text;
            step.line = logical.line;
            descriptor.steps.push_back(std::move(step));
            continue;
        }

        const size_t split = logical.text.find_first_of(" \t");
        const std::string keyword = toUpper(logical.text.substr(0, split));
        const std::string rest = split == std::string::npos
            ? std::string()
            : trim(logical.text.substr(split));

        if (keyword == "FROM") {
            if (seenFrom) {
                parseError(sourceName, logical.line,
                           "multiple FROM instructions are not supported");
            }
            const auto words = splitWords(rest);
            if (words.empty()) {
                parseError(sourceName, logical.line, "FROM requires an image reference");
            }
            if (words.front().rfind("--", 0) == 0) {
                parseError(sourceName, logical.line,
                           "FROM options are not supported: " + words.front());
            }
            if (words.size() != 1) {
                parseError(sourceName, logical.line,
                           "FROM takes exactly one image reference");
            }
            if (!isValidImageReference(words.front())) {
                parseError(sourceName, logical.line,
                           "invalid image reference '" + words.front() + "'");
            }
            descriptor.baseReference = normalizeImageReference(words.front());
            descriptor.baseLine = logical.line;
            seenFrom = true;
            continue;
        }

        if (keyword != "USER" && keyword != "RUN") {
            parseError(sourceName, logical.line, "unknown instruction: " + keyword);
        }
        if (!seenFrom) {
            parseError(sourceName, logical.line,
                       "instruction " + keyword + " found before FROM");
        }

        Step step;
        step.line = logical.line;
        step.payload = rest;

        if (keyword == "USER") {
            const auto words = splitWords(rest);
            if (words.empty()) {
                parseError(sourceName, logical.line, "USER requires a principal");
            }
            if (words.size() != 1) {
                parseError(sourceName, logical.line, "USER takes a single principal");
            }
            step.kind = StepKind::SetUser;
            step.payload = words.front();
        } else {
            if (rest.empty()) {
                parseError(sourceName, logical.line, "RUN requires a command");
            }
            step.kind = StepKind::Run;
            if (const auto exec = execFormCommand(rest, sourceName, logical.line)) {
                step.subCommands = {*exec};
            } else {
                step.subCommands = splitCompoundCommand(rest);
            }
        }

        descriptor.steps.push_back(std::move(step));
    }

    if (!seenFrom) {
        parseError(sourceName, 0, "no FROM instruction found");
    }

    SLOG_DEBUG(QStringLiteral("DescriptorParser"),
               QStringLiteral("parseDescriptor"),
               QStringLiteral("descriptor_parsed"),
               QStringLiteral("build_request"),
               QStringLiteral("line_oriented"),
               stratum::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"source", sourceName},
                               {"from", descriptor.baseReference},
                               {"steps", descriptor.steps.size()}}));
    return descriptor;
}

Descriptor parseDescriptorFile(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw BuildError(BuildErrorKind::Parse,
                         "cannot read descriptor '" + path + "'", 2);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parseDescriptor(content.str(), path);
}

} // namespace stratum
