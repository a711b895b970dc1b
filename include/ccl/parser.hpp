#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace ccl {

using ParseNode = tao::pegtl::parse_tree::node;

struct ParseResult {
    bool success{false};
    std::unique_ptr<ParseNode> root; // parse tree; references the source text, which must outlive it
    std::string error_message;       // If !success, expected-token message
    int line{0};
    int column{0};
};

class Parser {
public:
    // Parse contract source text into a parse tree. Syntactic validity only.
    ParseResult parse_string(std::string_view src, std::string_view filename = "contract") const;
};

// Debug rendering of a parse tree, one node per line, indented by depth.
std::string dump_parse_tree(const ParseNode& root);

} // namespace ccl
