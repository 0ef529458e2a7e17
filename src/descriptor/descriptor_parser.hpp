#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace stratum {

/**
 * Parse descriptor text into a base reference and its ordered steps.
 *
 * Recognizes FROM, USER, RUN (shell and exec form), '#' comments, line
 * continuations and a leading "# escape=" parser directive.
 *
 * Throws BuildError (kind Parse) with the offending line number.
 */
Descriptor parseDescriptor(const std::string &text, const std::string &sourceName);

// Reads the file and parses it; an unreadable file is a Parse error.
Descriptor parseDescriptorFile(const std::string &path);

/**
 * Split a RUN command into sub-commands at top-level "&&".
 *
 * The parts run in order inside one shell, so they share its state. Returns
 * the whole (trimmed) command as a single element whenever the cut could
 * change its meaning: other top-level list operators, shell groups, [[ ]]
 * tests, heredocs, comments, command substitution inside quotes, or empty
 * operands.
 */
std::vector<std::string> splitCompoundCommand(const std::string &command);

std::string shellQuote(const std::string &argument);

// "repo" -> "repo:latest"; references with a tag or digest are unchanged.
std::string normalizeImageReference(const std::string &reference);
bool isValidImageReference(const std::string &reference);

} // namespace stratum
