#include "ednstream/parser.hpp"
#include "ednstream/reader.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_events; double ms_tree; size_t events; };

static RunResult bench_case(const char* name, const std::string &doc){
    auto p = ednstream::parser::from_string(doc);
    auto t0 = Clock::now();
    size_t count = 0;
    while(auto ev = p.next()){
        if(ev->is_error()){
            std::cerr << "[bench] case '" << name << "' failed: " << ednstream::describe(*ev) << "\n";
            return {0.0, 0.0, 0};
        }
        ++count;
    }
    auto t1 = Clock::now();
    auto tree = ednstream::read_one(doc);
    auto t2 = Clock::now();
    (void)tree;
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(),
             std::chrono::duration<double, std::milli>(t2 - t1).count(), count };
}

int main(){
    struct Case { const char* name; std::string doc; };
    std::vector<Case> cases;

    // Case 1: flat vector of integers and floats
    {
        std::string s = "[";
        for(int i = 0; i < 20000; ++i){ s += std::to_string(i); s += (i % 3 == 0) ? " 1.5e3 " : " "; }
        s += "]";
        cases.push_back({"numbers", s});
    }

    // Case 2: records with keywords, strings and tags
    {
        std::string s = "(";
        for(int i = 0; i < 5000; ++i){
            s += "{:id " + std::to_string(i) + " :name \"user-" + std::to_string(i) +
                 "\" :tags #{:a :b} :at #inst \"2020-01-01\" :ns/flag true}\n";
        }
        s += ")";
        cases.push_back({"records", s});
    }

    // Case 3: deep nesting
    {
        const int depth = 10000;
        cases.push_back({"deep", std::string(depth, '[') + std::string(depth, ']')});
    }

    std::cout << "name,ms_events,ms_tree,events\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, c.doc);
        std::cout << c.name << "," << r.ms_events << "," << r.ms_tree << "," << r.events << "\n";
    }
    return 0;
}
