#include "ccl/parser.hpp"
#include "grammar.hpp"
#include <sstream>

namespace ccl {

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    ParseResult r;
    try {
        r.root = tao::pegtl::parse_tree::parse< grammar::contract, grammar::selector, tao::pegtl::nothing, grammar::control >(in);
        if(!r.root){ r.error_message = "expected contract declarations"; r.line = 1; r.column = 1; return r; }
        r.success = true;
        return r;
    } catch (const tao::pegtl::parse_error& e) {
        r.root.reset();
        r.error_message = std::string(e.message());
        if(!e.positions().empty()){
            const auto& p = e.positions().front();
            r.line = static_cast<int>(p.line);
            r.column = static_cast<int>(p.column);
        }
        return r;
    }
}

static void dump_node(std::ostringstream& os, const ParseNode& n, int depth){
    for(int i=0;i<depth;++i) os<<"  ";
    if(n.is_root()) os<<"ROOT";
    else {
        std::string_view t = n.type;
        if(auto pos = t.rfind("::"); pos != std::string_view::npos) t = t.substr(pos+2);
        os<<t;
        if(n.has_content()) os<<" \""<<n.string_view()<<"\"";
    }
    os<<"\n";
    for(auto &c: n.children) dump_node(os, *c, depth+1);
}

std::string dump_parse_tree(const ParseNode& root){
    std::ostringstream os; dump_node(os, root, 0); return os.str();
}

} // namespace ccl
