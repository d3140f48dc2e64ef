#pragma once

#include <string>
#include <vector>

int set_nonblocking(int file_descriptor);

// Set FD_CLOEXEC so the descriptor does not leak into spawned children.
int set_cloexec(int file_descriptor);

// Trim whitespace (space, tab, CR, LF) from both ends of a string.
// Returns a copy with the trimmed content.
std::string trim_copy(const std::string& str);

std::string to_lower_copy(const std::string& str);

bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

// Case-insensitive substring search. Returns std::string::npos if absent.
std::string::size_type find_ci(const std::string& haystack,
                               const std::string& needle,
                               std::string::size_type from = 0);

std::string join(const std::vector<std::string>& parts,
                 const std::string& separator);

std::vector<std::string> split_lines(const std::string& text);

// Parse a decimal integer made only of digits. Returns false on empty input,
// non-digit characters or overflow past INT_MAX.
bool parse_uint(const std::string& str, int& out);

// Milliseconds from a monotonic clock, for deadlines.
long long monotonic_ms();

// Deadlines are monotonic_ms() values; 0 means "no deadline".
bool deadline_expired(long long deadline);

// Milliseconds left before `deadline`, clamped to [0, cap]. A negative cap
// means uncapped, so with no deadline the result is -1 (wait forever).
int remaining_ms(long long deadline, int cap);

// Parse log level flag (e.g., "-l:0" for DEBUG, "-l:1" for INFO, "-l:2" for
// ERROR)
int parseLogLevelFlag(const std::string& arg);
