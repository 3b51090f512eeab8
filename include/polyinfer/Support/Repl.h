#pragma once

namespace polyinfer {
struct Session;

/// Read entries from stdin until end of input, inferring each against
/// `session`. Entries end with an empty line; lines starting with '#' are
/// commands (#help lists them). Re-executes itself under rlwrap when stdin
/// is a terminal and rlwrap is installed.
[[noreturn]] void runRepl(int argc, char **argv, Session &session);
} // namespace polyinfer
