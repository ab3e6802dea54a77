#pragma once

#include <causal/clock/causality.hpp>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "client.hpp"

namespace causal {
namespace client {

// "-> (happened-before)" and so on, for sent vs received clocks.
std::string describe_relation(clock::Relation relation);

/* Zero-based indices of the servers picked by a selection such as "1,3",
   duplicates dropped, in the order given. Throws std::invalid_argument for
   anything that is not a number in [1, count]. */
std::vector<size_t> parse_selection(const std::string &text, size_t count);

// Interactive console front end over a Client.
class Menu {
   public:
    Menu(Client &client, std::istream &in, std::ostream &out);

    // Runs until "0" or end of input.
    void run();

    void calculate_auto();
    void calculate_manual();
    void show_health();
    void show_clock();
    void show_events();

   private:
    std::optional<std::string> prompt(std::string_view text);
    std::optional<int64_t> prompt_number(std::string_view text);
    void show_calculation(const Calculation &calculation);

    Client &client_;
    std::istream &in_;
    std::ostream &out_;
};

}  // namespace client
}  // namespace causal
