#include <ripple/ripple.h>

#include <fmt/core.h>

#include <string>

using namespace std::string_literals;

int main() {
  auto rt = ripple::runtime{};

  auto first_name = rt.cell("Anita"s);
  auto last_name = rt.cell("Laera"s);
  auto nick_name = rt.cell(""s);

  auto full_name = rt.derived([=] {
    fmt::print("derived full_name\n");
    if (nick_name() != "")
      return nick_name();
    else
      return first_name() + " " + last_name();
  });

  auto display_full = rt.cell(true);
  auto stop = rt.effect([=] {
    fmt::print("effect\n");
    if (display_full())
      fmt::print(">> {}\n", full_name());
    else
      fmt::print("display disabled\n");

    return [] { fmt::print("effect cleanup\n"); };
  });

  // Anita Laera
  first_name.set("Missi");
  // full_name >> effect >> Missi Laera
  rt.batch([&] {
    first_name.set("Erik");
    last_name.set("Valkering");
  });
  // full_name >> effect >> Erik Valkering
  nick_name.set("Erik Valkering");
  // full_name
  display_full.set(false);
  // effect >> display disabled
  nick_name.set("Ciri");
  // nothing, full_name is no longer observed

  const auto stats = rt.stats();
  fmt::print("{} recomputations, {} effect runs\n", stats.recomputations,
             stats.effect_runs);

  stop();
}
