#pragma once

#include <iosfwd>

/*
 * seqfind_runner <sequence.fa> [pattern] [config.json]
 *
 * Returns the process exit code: 0 on success (a search with no match
 * included), 1 on usage error, 2 when the file cannot be loaded, 3 on a bad
 * configuration file or a failed search.
 */
int run_cli(int argc, const char *const *argv, std::ostream &out, std::ostream &err);
