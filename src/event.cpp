#include "ednstream/event.hpp"
#include <sstream>

namespace ednstream {

bool is_scalar(event_kind k){
    switch(k){
        case event_kind::nil_value: case event_kind::boolean_value: case event_kind::string_value:
        case event_kind::character_value: case event_kind::symbol_value: case event_kind::keyword_value:
        case event_kind::integer_value: case event_kind::float_value:
            return true;
        default: return false;
    }
}

bool is_collection_start(event_kind k){
    return k==event_kind::list_start || k==event_kind::vector_start || k==event_kind::set_start || k==event_kind::map_start;
}

bool is_collection_end(event_kind k){
    return k==event_kind::list_end || k==event_kind::vector_end || k==event_kind::set_end || k==event_kind::map_end;
}

collection_kind collection_of(event_kind k){
    switch(k){
        case event_kind::list_start: case event_kind::list_end: return collection_kind::list;
        case event_kind::vector_start: case event_kind::vector_end: return collection_kind::vector;
        case event_kind::set_start: case event_kind::set_end: return collection_kind::set;
        default: return collection_kind::map;
    }
}

event_kind start_event(collection_kind c){
    switch(c){
        case collection_kind::list: return event_kind::list_start;
        case collection_kind::vector: return event_kind::vector_start;
        case collection_kind::set: return event_kind::set_start;
        case collection_kind::map: return event_kind::map_start;
    }
    return event_kind::list_start;
}

event_kind end_event(collection_kind c){
    switch(c){
        case collection_kind::list: return event_kind::list_end;
        case collection_kind::vector: return event_kind::vector_end;
        case collection_kind::set: return event_kind::set_end;
        case collection_kind::map: return event_kind::map_end;
    }
    return event_kind::list_end;
}

char32_t closer_of(collection_kind c){
    switch(c){
        case collection_kind::list: return U')';
        case collection_kind::vector: return U']';
        case collection_kind::set: case collection_kind::map: return U'}';
    }
    return U')';
}

const char* to_string(event_kind k){
    switch(k){
        case event_kind::nil_value: return "nil";
        case event_kind::boolean_value: return "boolean";
        case event_kind::string_value: return "string";
        case event_kind::character_value: return "character";
        case event_kind::symbol_value: return "symbol";
        case event_kind::keyword_value: return "keyword";
        case event_kind::integer_value: return "integer";
        case event_kind::float_value: return "float";
        case event_kind::tag: return "tag";
        case event_kind::list_start: return "list-start";
        case event_kind::list_end: return "list-end";
        case event_kind::vector_start: return "vector-start";
        case event_kind::vector_end: return "vector-end";
        case event_kind::set_start: return "set-start";
        case event_kind::set_end: return "set-end";
        case event_kind::map_start: return "map-start";
        case event_kind::map_end: return "map-end";
        case event_kind::error: return "error";
    }
    return "unknown";
}

const char* to_string(collection_kind c){
    switch(c){
        case collection_kind::list: return "list";
        case collection_kind::vector: return "vector";
        case collection_kind::set: return "set";
        case collection_kind::map: return "map";
    }
    return "unknown";
}

std::string describe(const event& e){
    std::ostringstream os;
    os<<to_string(e.kind);
    switch(e.kind){
        case event_kind::boolean_value: os<<' '<<(e.boolean()?"true":"false"); break;
        case event_kind::integer_value: os<<' '<<e.integer(); break;
        case event_kind::float_value: os<<' '<<e.floating(); break;
        case event_kind::character_value: os<<" U+"<<std::hex<<std::uppercase<<static_cast<uint32_t>(e.character()); break;
        case event_kind::string_value: case event_kind::symbol_value: case event_kind::keyword_value: case event_kind::tag:
            os<<' '<<e.text(); break;
        case event_kind::error: os<<' '<<format_error(e.error()); break;
        default: break;
    }
    return os.str();
}

} // namespace ednstream
