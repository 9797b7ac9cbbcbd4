#pragma once

#include <string>
#include <vector>

class Grid;

// ---- Seed Patterns ---- //
struct Pattern {
    std::string name;
    std::vector<std::vector<int>> cells; // 0/1 rows, possibly jagged
};

const std::vector<Pattern>& builtinPatterns();

// Case-insensitive lookup; throws std::runtime_error for unknown names.
const Pattern& findPattern(const std::string& name);

// ---- Grid files ---- //
// One row per line, whitespace separated 0/1 values, blank lines skipped.
Pattern loadPatternFile(const std::string& filename);
void savePatternFile(const std::string& filename, const Grid& grid);
