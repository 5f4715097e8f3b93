/**
 * ResponseCleaner.hpp - Strip model formatting quirks from a suggested command
 */

#pragma once

#include <string>

namespace shlama {

/**
 * Best-effort cleanup of a raw model reply, in this order:
 *   1. one leading ``` fence, with a language tag when a line break follows it
 *   2. one trailing ``` fence
 *   3. one leading and one trailing inline-code backtick
 * and surrounding whitespace after each step.
 *
 * Handles a single level of fencing only. Nested or multiple code blocks are
 * not recognized and come back with their inner fences intact.
 */
std::string cleanResponse(const std::string& raw);

} // namespace shlama
