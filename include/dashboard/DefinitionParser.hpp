#pragma once
#include "Definition.hpp"
#include "reload/FileLoader.hpp"
#include <memory>
#include <string_view>
#include <vector>

// Compiles the line-oriented dashboard language into a Definition.
//
//   // comment
//   #load "common.fsx"
//   title "System" fg=cyan bold
//   border rounded
//   layout horizontal
//   theme slime
//   state cpu 0.42
//   reset status "starting"
//   panel stats 40% "Stats"
//   text "CPU: {cpu}"
//   gauge cpu "CPU"
//   list procs "init" "sshd" "bash"
//
// Errors throw LoadError(ParseError) with 1-based line and column.
class DefinitionParser {
public:
    // Files in evaluation order (dependencies first), as from loadTree().
    static Definition compile(const std::vector<std::shared_ptr<const LoadedFile>>& files);

    // Applies one file's statements on top of `def`.
    static void parseInto(Definition& def, std::string_view source,
                          const std::filesystem::path& path);

    static Definition parse(std::string_view source,
                            const std::filesystem::path& path = "<memory>");
};
