#include "ednstream/diagnostics_json.hpp"
#include "ednstream/options.hpp"
#include <iomanip>
#include <sstream>
#include <cstdio>

namespace ednstream {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string error_to_json(const parser_error& e){
    std::ostringstream os;
    os<<"{\"code\":"<<json_escape(to_string(e.code))
      <<",\"origin\":"<<json_escape(to_string(e.origin))
      <<",\"message\":"<<json_escape(e.message)
      <<",\"line\":"<<e.line
      <<",\"col\":"<<e.col
      <<"}";
    return os.str();
}

std::string events_to_json(const std::vector<event>& events){
    std::ostringstream os;
    os<<"[";
    for(size_t i=0;i<events.size(); ++i){
        const auto &ev=events[i]; if(i) os<<",";
        os<<"{\"event\":"<<json_escape(to_string(ev.kind))
          <<",\"line\":"<<ev.line
          <<",\"col\":"<<ev.col;
        switch(ev.kind){
            case event_kind::string_value: case event_kind::symbol_value: case event_kind::keyword_value: case event_kind::tag:
                os<<",\"text\":"<<json_escape(ev.text()); break;
            case event_kind::boolean_value: os<<",\"value\":"<<(ev.boolean()?"true":"false"); break;
            case event_kind::integer_value: os<<",\"value\":"<<ev.integer(); break;
            case event_kind::float_value: os<<",\"value\":"<<std::setprecision(17)<<ev.floating(); break;
            case event_kind::character_value: os<<",\"value\":"<<static_cast<uint32_t>(ev.character()); break;
            case event_kind::error: os<<",\"error\":"<<error_to_json(ev.error()); break;
            default: break;
        }
        os<<"}";
    }
    os<<"]";
    return os.str();
}

void maybe_print_json(const parser_error& e){
    if(flag_enabled("EDNSTREAM_DIAG_JSON")){
        auto js=error_to_json(e);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace ednstream
