/*
 * Synchronous sequences
 *
 * Nothing runs until a terminal operation asks for values, and each value
 * flows through the whole pipeline before the next one is pulled.
 */

#include <iostream>
#include <lazyseq/sequence.hpp>
#include <string>
#include <vector>

struct book {
    std::string title;
    std::string author;
    int year;
};

int main() {
    std::vector<book> shelf{
        {"Kindred", "Octavia Butler", 1979},
        {"Neuromancer", "William Gibson", 1984},
        {"Dawn", "Octavia Butler", 1987},
        {"The Dispossessed", "Ursula Le Guin", 1974},
    };

    auto books = lazyseq::from(shelf);
    auto titles = books.filter([](const book& b) { return b.year < 1985; })
                      .map([](const book& b) {
                          std::cout << "  mapping " << b.title << std::endl;
                          return b.title;
                      });

    std::cout << titles << std::endl;
    std::cout << "first: " << titles.first().value_or("none") << std::endl;
    std::cout << "all: " << titles.join(lazyseq::join_options<std::string>{.prefix = "[", .postfix = "]"}) << std::endl;

    for (const auto& [author, written] : books.group_by([](const book& b) { return b.author; })) {
        std::cout << author << ": " << written.size() << std::endl;
    }

    auto squares = lazyseq::generate(1, [](int x) { return x + 1; })
                       .map([](int x) { return x * x; })
                       .take_while([](int x) { return x < 200; });
    std::cout << "squares: " << squares.join({.limit = 8}) << std::endl;
    std::cout << "sum of squares: " << squares.fold(0, [](int acc, int x) { return acc + x; })
              << std::endl;
    return 0;
}
