// demo_basic.cpp
//
// Prints the nil YYID and a fresh random one in every text encoding, lower
// and upper case, then shows a round trip through the parser:
//
//     ./demo_basic

#include <yyid/codec.hpp>
#include <yyid/log.hpp>
#include <yyid/parse.hpp>
#include <yyid/yyid.hpp>

#include <iostream>

using namespace yyid;

static void show(const char* title, const Yyid& id) {
    std::cout << "\nUsing " << title << "\n";
    std::cout << "[lower] [yyid]     " << id << "\n";
    std::cout << "[lower] [Hyphen]   " << hyphenated(id) << "\n";
    std::cout << "[lower] [Simple]   " << simple(id) << "\n";
    std::cout << "[lower] [URN]      " << urn(id) << "\n";
    std::cout << "[lower] [Braced]   " << braced(id) << "\n";
    std::cout << "---------------------------------------------------------------------\n";
    std::cout << "[upper] [Hyphen]   " << hyphenated(id).to_upper_string() << "\n";
    std::cout << "[upper] [Simple]   " << simple(id).to_upper_string() << "\n";
    std::cout << "[upper] [URN]      " << urn(id).to_upper_string() << "\n";
    std::cout << "[upper] [Braced]   " << braced(id).to_upper_string() << "\n";
}

int main() {
    log::set_level(log::Info);

    show("Yyid::nil()", Yyid::nil());
    std::cout << "\n=====================================================================\n";

    auto id = Yyid::random();
    show("Yyid::random()", id);

    auto parsed = parse_yyid(urn(id).to_upper_string());
    if (parsed.is_err()) {
        std::cerr << "\n" << parsed.error().format() << "\n";
        return 1;
    }
    log::info("URN round trip %s", parsed.value() == id ? "matches" : "DIFFERS");
    return parsed.value() == id ? 0 : 1;
}
