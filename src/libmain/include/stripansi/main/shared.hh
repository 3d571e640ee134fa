#pragma once
///@file

#include <functional>
#include <string>

namespace stripansi {

/**
 * Run `fun`, reporting any exception it throws to the logger in the
 * standard format.
 *
 * @return The exit status of the program: 0, or the status carried by
 * the error.
 */
int handleExceptions(std::function<void()> fun);

/**
 * Process-wide setup for command-line programs. Must be called before
 * anything is written to a pipe.
 */
void initLibMain();

} // namespace stripansi
