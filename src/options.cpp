#include "ednstream/options.hpp"
#include <cstdlib>

namespace ednstream {

bool flag_enabled(const char* name){
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

bool flag_disabled(const char* name){
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='0' || *v=='f' || *v=='F' || *v=='n' || *v=='N';
}

parser_options detect_options(){
    parser_options o;
    if(flag_disabled("EDNSTREAM_COMMENTS")) o.allow_comments = false;
    o.strict_commas = flag_enabled("EDNSTREAM_STRICT_COMMAS");
    o.trace = flag_enabled("EDNSTREAM_TRACE");
    return o;
}

} // namespace ednstream
