#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "logger.hpp"
#include "timers/clock_source.hpp"
#include "timers/timer_action.hpp"
#include "timers/timer_config.hpp"
#include "timers/timer_errors.hpp"
#include "timers/timer_registry.hpp"

using namespace polltimer;

namespace {

#define CHECK(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "CHECK failed: " #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

template <typename F>
bool throwsTimerError(F&& f, TimerErrc code) {
  try {
    f();
  } catch (const TimerError& e) {
    return e.code() == code;
  }
  return false;
}

// Config with a counting action
TimerConfig counting(int& hits, std::optional<std::int64_t> interval,
                     std::optional<std::int64_t> expiration = std::nullopt) {
  TimerConfig cfg;
  cfg.interval = interval;
  cfg.expiration = expiration;
  cfg.action = makeAction("count", [&hits]() { ++hits; });
  return cfg;
}

bool test_ticks_diff_orders_across_wrap() {
  CHECK(ticksDiff(10, 65530, 65536) == 16);
  CHECK(ticksDiff(65530, 10, 65536) == -16);
  CHECK(ticksDiff(500, 500, 65536) == 0);
  CHECK(ticksAdd(65530, 16, 65536) == 10);
  CHECK(ticksAdd(10, -16, 65536) == 65530);
  CHECK(isValidTickPeriod(kDefaultTickPeriod));
  CHECK(!isValidTickPeriod(1000));
  CHECK(throwsTimerError([] { ManualClock bad(1000); }, TimerErrc::InvalidConfig));
  return true;
}

bool test_short_timer_no_early_fire_then_fires_once() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("blink", counting(hits, 100));
  registry.start("blink");

  clock.advanceMs(99);
  CHECK(registry.poll() == 0);
  CHECK(hits == 0);
  CHECK(registry.at("blink").isSet());

  clock.advanceMs(1);
  CHECK(registry.poll() == 1);
  CHECK(hits == 1);
  CHECK(!registry.at("blink").isSet());

  clock.advanceMs(1000);
  CHECK(registry.poll() == 0);
  CHECK(hits == 1);
  return true;
}

bool test_unstarted_timer_never_fires() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("idle", counting(hits, 10));
  clock.advanceMs(50);
  CHECK(registry.poll() == 0);
  CHECK(hits == 0);
  // expiration was anchored at construction
  CHECK(registry.at("idle").expiration() == 10);
  return true;
}

bool test_short_timer_interval_straddles_wrap() {
  ManualClock clock(65536);
  clock.setTicks(65500);
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("wrap", counting(hits, 46));
  registry.start("wrap");
  CHECK(registry.at("wrap").expiration() == 10);

  clock.advanceMs(45);
  CHECK(clock.ticksMs() == 65545);
  CHECK(registry.poll() == 0);

  clock.advanceMs(1);
  CHECK(clock.ticksMs() == 10);
  CHECK(registry.poll() == 1);
  CHECK(hits == 1);
  return true;
}

bool test_short_timer_absolute_expiration_after_wrap() {
  ManualClock clock(65536);
  clock.setTicks(65520);
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("abs", counting(hits, std::nullopt, 65530));
  registry.start("abs");
  CHECK(!registry.at("abs").isStale());

  clock.setTicks(65529);
  CHECK(registry.poll() == 0);

  clock.setTicks(10);
  CHECK(registry.poll() == 1);
  CHECK(hits == 1);
  return true;
}

bool test_short_interval_limited_to_half_period() {
  ManualClock clock(65536);
  TimerRegistry registry(clock);
  int hits = 0;

  CHECK(throwsTimerError([&] { registry.setup("big", counting(hits, 32768)); },
                         TimerErrc::InvalidConfig));
  registry.setup("max", counting(hits, 32767));
  CHECK(registry.contains("max"));
  CHECK(!registry.contains("big"));
  return true;
}

bool test_long_timer_uses_seconds() {
  ManualClock clock(kDefaultTickPeriod, 1000);
  TimerRegistry registry(clock);
  int hits = 0;

  TimerConfig cfg = counting(hits, 5);
  cfg.isLong = true;
  registry.setup("slow", cfg);
  CHECK(registry.at("slow").kind() == TimerKind::Long);
  registry.start("slow");

  clock.advanceSeconds(4);
  CHECK(registry.poll() == 0);
  clock.advanceMs(999);
  CHECK(registry.poll() == 0);
  clock.advanceMs(1);
  CHECK(registry.poll() == 1);
  CHECK(hits == 1);
  return true;
}

bool test_past_absolute_expiration_never_fires() {
  ManualClock clock(kDefaultTickPeriod, 1000);
  TimerRegistry registry(clock);
  int hits = 0;

  TimerConfig cfg = counting(hits, std::nullopt, 900);
  cfg.isLong = true;
  registry.setup("late", cfg);
  CHECK(registry.at("late").isStale());
  registry.start("late");
  clock.advanceSeconds(10);
  CHECK(registry.poll() == 0);
  CHECK(hits == 0);

  // trigger still runs it, override revives it
  registry.trigger("late");
  CHECK(hits == 1);
  registry.overrideExpiration("late", 2);
  registry.start("late");
  clock.advanceSeconds(2);
  CHECK(registry.poll() == 1);
  CHECK(hits == 2);
  return true;
}

bool test_absolute_expiration_not_reanchored_by_start() {
  ManualClock clock(kDefaultTickPeriod, 0);
  TimerRegistry registry(clock);
  int hits = 0;

  TimerConfig cfg = counting(hits, std::nullopt, 30);
  cfg.isLong = true;
  registry.setup("at30", cfg);
  registry.start("at30");
  clock.advanceSeconds(20);
  registry.start("at30");
  CHECK(registry.at("at30").expiration() == 30);
  clock.advanceSeconds(10);
  CHECK(registry.poll() == 1);
  return true;
}

bool test_override_fires_after_delta_regardless_of_interval() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("ovr", counting(hits, 1000));
  registry.start("ovr");
  registry.overrideExpiration("ovr", 50);
  CHECK(registry.at("ovr").isSet());

  clock.advanceMs(50);
  CHECK(registry.poll() == 1);
  CHECK(hits == 1);

  // consumed by the fire: the next start uses the interval again
  CHECK(!registry.at("ovr").overridePending());
  registry.start("ovr");
  clock.advanceMs(50);
  CHECK(registry.poll() == 0);
  clock.advanceMs(950);
  CHECK(registry.poll() == 1);
  return true;
}

bool test_override_on_stopped_timer_survives_next_start() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("later", counting(hits, 1000));
  registry.overrideExpiration("later", 30);
  CHECK(!registry.at("later").isSet());

  registry.start("later");
  clock.advanceMs(30);
  CHECK(registry.poll() == 1);

  // a second start re-anchors from the interval
  registry.start("later");
  clock.advanceMs(30);
  CHECK(registry.poll() == 0);
  CHECK(hits == 1);
  return true;
}

bool test_trigger_fires_now_and_disarms() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("t", counting(hits, 5000));
  registry.start("t");
  registry.trigger("t");
  CHECK(hits == 1);
  CHECK(!registry.at("t").isSet());

  clock.advanceMs(6000);
  CHECK(registry.poll() == 0);
  CHECK(hits == 1);

  // also works on a never-started timer
  registry.trigger("t");
  CHECK(hits == 2);
  return true;
}

bool test_args_expand_to_positional_arguments() {
  ManualClock clock;
  TimerRegistry registry(clock);
  std::vector<ActionArgs> calls;

  auto make = [&](nlohmann::json args) {
    TimerConfig cfg;
    cfg.interval = 0;
    cfg.args = std::move(args);
    cfg.action = makeAction("record", ActionFn([&calls](const ActionArgs& a) { calls.push_back(a); }));
    return cfg;
  };

  registry.setup("pair", make(nlohmann::json::array({1, 2})));
  registry.setup("scalar", make(5));
  registry.setup("none", make(nlohmann::json()));
  registry.trigger("pair");
  registry.trigger("scalar");
  registry.trigger("none");

  CHECK(calls.size() == 3);
  CHECK(calls[0].size() == 2);
  CHECK(calls[0][0] == 1);
  CHECK(calls[0][1] == 2);
  CHECK(calls[1].size() == 1);
  CHECK(calls[1][0] == 5);
  CHECK(calls[2].empty());
  return true;
}

bool test_stop_is_idempotent() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("s", counting(hits, 10));
  registry.stop("s");
  registry.stop("s");
  registry.start("s");
  registry.stop("s");
  registry.stop("s");
  CHECK(!registry.at("s").isSet());
  clock.advanceMs(20);
  CHECK(registry.poll() == 0);
  return true;
}

bool test_action_restarting_itself_fires_once_per_pass() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  TimerConfig cfg;
  cfg.interval = 0;
  cfg.running = true;
  cfg.action = makeAction("again", [&]() {
    ++hits;
    registry.start("again");
  });
  registry.setup("again", cfg);

  CHECK(registry.poll() == 1);
  CHECK(hits == 1);
  CHECK(registry.at("again").isSet());

  CHECK(registry.poll() == 1);
  CHECK(hits == 2);
  return true;
}

bool test_repeating_timer_with_interval() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  TimerConfig cfg;
  cfg.interval = 100;
  cfg.action = makeAction("tick", [&]() {
    ++hits;
    registry.start("tick");
  });
  registry.setup("tick", cfg);
  registry.start("tick");

  for (int i = 0; i < 5; ++i) {
    clock.advanceMs(100);
    CHECK(registry.poll() == 1);
  }
  clock.advanceMs(99);
  CHECK(registry.poll() == 0);
  CHECK(hits == 5);
  return true;
}

bool test_unknown_names_raise_timer_not_found() {
  ManualClock clock;
  TimerRegistry registry(clock);

  CHECK(throwsTimerError([&] { registry.start("nope"); }, TimerErrc::TimerNotFound));
  CHECK(throwsTimerError([&] { registry.stop("nope"); }, TimerErrc::TimerNotFound));
  CHECK(throwsTimerError([&] { registry.trigger("nope"); }, TimerErrc::TimerNotFound));
  CHECK(throwsTimerError([&] { registry.overrideExpiration("nope", 1); }, TimerErrc::TimerNotFound));
  CHECK(throwsTimerError([&] { registry.at("nope"); }, TimerErrc::TimerNotFound));
  CHECK(!registry.remove("nope"));
  return true;
}

bool test_failed_setup_leaves_registry_unchanged() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  Timer& kept = registry.setup("keep", counting(hits, 10));

  TimerConfig noTime;
  noTime.action = makeAction("x", []() {});
  CHECK(throwsTimerError([&] { registry.setup("keep", noTime); }, TimerErrc::InvalidConfig));

  TimerConfig noAction;
  noAction.interval = 5;
  CHECK(throwsTimerError([&] { registry.setup("keep", noAction); }, TimerErrc::InvalidConfig));
  CHECK(throwsTimerError([&] { registry.setup("fresh", noAction); }, TimerErrc::InvalidConfig));

  CHECK(&registry.at("keep") == &kept);
  CHECK(!registry.contains("fresh"));
  CHECK(registry.size() == 1);
  return true;
}

bool test_registry_mutation_during_poll() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int firstHits = 0, secondHits = 0, thirdHits = 0;

  TimerConfig first;
  first.interval = 0;
  first.running = true;
  first.action = makeAction("first", [&]() {
    ++firstHits;
    registry.remove("second");
    TimerConfig third = counting(thirdHits, 0);
    third.running = true;
    registry.setup("third", third);
    registry.remove("first");
  });
  registry.setup("first", first);

  TimerConfig second = counting(secondHits, 0);
  second.running = true;
  registry.setup("second", second);

  CHECK(registry.poll() == 1);
  CHECK(firstHits == 1);
  CHECK(secondHits == 0);
  CHECK(thirdHits == 0);
  CHECK(!registry.contains("first"));
  CHECK(!registry.contains("second"));

  CHECK(registry.poll() == 1);
  CHECK(thirdHits == 1);
  return true;
}

bool test_replaced_timer_skipped_in_same_pass() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int oldHits = 0, newHits = 0;

  TimerConfig a;
  a.interval = 0;
  a.running = true;
  a.action = makeAction("a", [&]() {
    TimerConfig fresh = counting(newHits, 0);
    fresh.running = true;
    registry.setup("b", fresh);
  });
  registry.setup("a", a);

  TimerConfig b = counting(oldHits, 0);
  b.running = true;
  registry.setup("b", b);

  CHECK(registry.poll() == 1);
  CHECK(oldHits == 0);
  CHECK(newHits == 0);
  CHECK(registry.poll() == 1);
  CHECK(newHits == 1);
  return true;
}

bool test_action_exception_propagates_and_timer_stays_disarmed() {
  ManualClock clock;
  TimerRegistry registry(clock);

  TimerConfig cfg;
  cfg.interval = 0;
  cfg.running = true;
  cfg.action = makeAction("boom", []() { throw std::runtime_error("boom"); });
  registry.setup("boom", cfg);

  bool threw = false;
  try {
    registry.poll();
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "boom";
  }
  CHECK(threw);
  CHECK(!registry.at("boom").isSet());
  CHECK(registry.poll() == 0);
  return true;
}

bool test_listing_is_ordered_and_restartable() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("zeta", counting(hits, 10));
  registry.setup("alpha", counting(hits, 20));
  TimerConfig longCfg = counting(hits, 3);
  longCfg.isLong = true;
  registry.setup("mid", longCfg);
  registry.setup("zeta", counting(hits, 30));   // replaced in place

  auto collect = [&]() {
    std::vector<std::string> names;
    for (const auto& item : registry.list()) {
      names.push_back(item.name);
    }
    return names;
  };

  const std::vector<std::string> expected{"zeta", "alpha", "mid"};
  CHECK(collect() == expected);
  CHECK(collect() == expected);

  auto listing = registry.list();
  auto it = listing.begin();
  CHECK((*it).state.find("Type:ShortTimer") != std::string::npos);
  CHECK((*it).state.find("Interval:30") != std::string::npos);
  CHECK((*it).state.find("Is set:false") != std::string::npos);
  CHECK((*it).state.find("Action:count") != std::string::npos);
  ++it; ++it;
  CHECK((*it).state.find("Type:LongTimer") != std::string::npos);
  ++it;
  CHECK(it == listing.end());
  return true;
}

bool test_parse_flag_normalization() {
  using nlohmann::json;
  CHECK(parseFlag(json(true)));
  CHECK(!parseFlag(json(false)));
  CHECK(!parseFlag(json("false")));
  CHECK(!parseFlag(json("FaLsE")));
  CHECK(!parseFlag(json("")));
  CHECK(parseFlag(json("true")));
  CHECK(parseFlag(json("no")));
  CHECK(parseFlag(json(1)));
  CHECK(!parseFlag(json(0)));
  CHECK(!parseFlag(json()));
  return true;
}

bool test_parse_timer_config() {
  using nlohmann::json;
  ActionCatalog catalog;
  int hits = 0;
  catalog.add("count", [&hits](const ActionArgs&) { ++hits; });
  catalog.add("ping", [&hits](const ActionArgs&) { hits += 10; }, "net");

  TimerConfig cfg = parseTimerConfig(
      json{{"interval", 250}, {"action", "count"}, {"long", "False"}, {"running", "yes"},
           {"args", json::array({"a", 1})}},
      catalog);
  CHECK(cfg.interval && *cfg.interval == 250);
  CHECK(!cfg.expiration);
  CHECK(!cfg.isLong);
  CHECK(cfg.running);
  CHECK(cfg.args.size() == 2);
  CHECK(cfg.action.label == "count");

  TimerConfig fromLib = parseTimerConfig(
      json{{"expiration", 99}, {"action", "ping"}, {"library", "net"}, {"long", true}}, catalog);
  CHECK(fromLib.isLong);
  CHECK(fromLib.expiration && *fromLib.expiration == 99);
  CHECK(fromLib.action.label == "net.ping");
  fromLib.action.invoke(fromLib.args);
  CHECK(hits == 10);

  TimerConfig fromSource = parseTimerConfig(
      json{{"interval", 1}, {"action", "ping"}, {"source", "net"}}, catalog);
  CHECK(fromSource.action.label == "net.ping");

  CHECK(throwsTimerError([&] { parseTimerConfig(json{{"action", "count"}}, catalog); },
                         TimerErrc::InvalidConfig));
  CHECK(throwsTimerError([&] { parseTimerConfig(json{{"interval", 5}}, catalog); },
                         TimerErrc::InvalidConfig));
  CHECK(throwsTimerError([&] { parseTimerConfig(json{{"interval", "5"}, {"action", "count"}}, catalog); },
                         TimerErrc::InvalidConfig));
  CHECK(throwsTimerError([&] { parseTimerConfig(json::array(), catalog); },
                         TimerErrc::InvalidConfig));
  CHECK(throwsTimerError([&] { parseTimerConfig(json{{"interval", 5}, {"action", "missing"}}, catalog); },
                         TimerErrc::ActionResolutionFailure));
  CHECK(throwsTimerError([&] { parseTimerConfig(json{{"interval", 5}, {"action", "count"}, {"library", "net"}}, catalog); },
                         TimerErrc::ActionResolutionFailure));
  CHECK(throwsTimerError([&] { parseTimerConfig(json{{"interval", 5}, {"action", "count"}, {"library", "nowhere"}}, catalog); },
                         TimerErrc::ActionResolutionFailure));
  return true;
}

bool test_interval_wins_over_expiration() {
  ManualClock clock;
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("both", counting(hits, 40, 5));
  CHECK(registry.at("both").expiration() == 40);
  registry.start("both");
  clock.advanceMs(5);
  CHECK(registry.poll() == 0);
  clock.advanceMs(35);
  CHECK(registry.poll() == 1);
  return true;
}

bool test_short_override_limited_to_half_period() {
  ManualClock clock(65536);
  TimerRegistry registry(clock);
  int hits = 0;

  registry.setup("s", counting(hits, 1000));
  registry.start("s");
  CHECK(throwsTimerError([&] { registry.overrideExpiration("s", 40000); }, TimerErrc::InvalidConfig));
  CHECK(throwsTimerError([&] { registry.overrideExpiration("s", 32768); }, TimerErrc::InvalidConfig));
  CHECK(throwsTimerError([&] { registry.overrideExpiration("s", -32768); }, TimerErrc::InvalidConfig));

  // rejected overrides leave the timer as it was
  CHECK(!registry.at("s").overridePending());
  CHECK(registry.at("s").expiration() == 1000);
  CHECK(registry.poll() == 0);
  CHECK(hits == 0);

  registry.overrideExpiration("s", 32767);
  clock.advanceMs(32766);
  CHECK(registry.poll() == 0);
  clock.advanceMs(1);
  CHECK(registry.poll() == 1);
  CHECK(hits == 1);
  return true;
}

bool test_long_delta_overflow_rejected() {
  using limits = std::numeric_limits<std::int64_t>;
  ManualClock clock(kDefaultTickPeriod, 1000);
  TimerRegistry registry(clock);
  int hits = 0;

  TimerConfig huge = counting(hits, limits::max());
  huge.isLong = true;
  CHECK(throwsTimerError([&] { registry.setup("huge", huge); }, TimerErrc::InvalidConfig));
  CHECK(!registry.contains("huge"));

  TimerConfig cfg = counting(hits, 10);
  cfg.isLong = true;
  registry.setup("l", cfg);
  registry.start("l");
  CHECK(throwsTimerError([&] { registry.overrideExpiration("l", limits::max()); }, TimerErrc::InvalidConfig));
  CHECK(registry.at("l").expiration() == 1010);
  CHECK(registry.poll() == 0);

  registry.overrideExpiration("l", limits::max() - 1000);
  CHECK(registry.at("l").expiration() == limits::max());
  clock.advanceSeconds(100);
  CHECK(registry.poll() == 0);
  CHECK(hits == 0);
  return true;
}

bool test_long_restart_saturates_instead_of_wrapping() {
  using limits = std::numeric_limits<std::int64_t>;
  ManualClock clock(kDefaultTickPeriod, 1000);
  TimerRegistry registry(clock);
  int hits = 0;

  TimerConfig cfg = counting(hits, limits::max() - 1000);
  cfg.isLong = true;
  registry.setup("far", cfg);
  CHECK(registry.at("far").expiration() == limits::max());

  clock.advanceSeconds(5);
  registry.start("far");
  CHECK(registry.at("far").expiration() == limits::max());
  CHECK(registry.poll() == 0);
  CHECK(hits == 0);
  return true;
}

bool test_short_absolute_expiration_beyond_half_period_is_stale() {
  ManualClock clock(65536);
  TimerRegistry registry(clock);
  int hits = 0;

  // 40000 ticks ahead is indistinguishable from 25536 ticks behind
  registry.setup("far", counting(hits, std::nullopt, 40000));
  registry.setup("near", counting(hits, std::nullopt, 32767));
  CHECK(registry.at("far").isStale());
  CHECK(!registry.at("near").isStale());

  registry.start("far");
  clock.advanceMs(40000);
  CHECK(registry.poll() == 0);
  CHECK(hits == 0);
  return true;
}

} // namespace

int main() {
  setLogLevel(LogLevel::Error);
  bool ok = true;

  ok &= test_ticks_diff_orders_across_wrap();
  ok &= test_short_timer_no_early_fire_then_fires_once();
  ok &= test_unstarted_timer_never_fires();
  ok &= test_short_timer_interval_straddles_wrap();
  ok &= test_short_timer_absolute_expiration_after_wrap();
  ok &= test_short_interval_limited_to_half_period();
  ok &= test_long_timer_uses_seconds();
  ok &= test_past_absolute_expiration_never_fires();
  ok &= test_absolute_expiration_not_reanchored_by_start();
  ok &= test_override_fires_after_delta_regardless_of_interval();
  ok &= test_override_on_stopped_timer_survives_next_start();
  ok &= test_trigger_fires_now_and_disarms();
  ok &= test_args_expand_to_positional_arguments();
  ok &= test_stop_is_idempotent();
  ok &= test_action_restarting_itself_fires_once_per_pass();
  ok &= test_repeating_timer_with_interval();
  ok &= test_unknown_names_raise_timer_not_found();
  ok &= test_failed_setup_leaves_registry_unchanged();
  ok &= test_registry_mutation_during_poll();
  ok &= test_replaced_timer_skipped_in_same_pass();
  ok &= test_action_exception_propagates_and_timer_stays_disarmed();
  ok &= test_listing_is_ordered_and_restartable();
  ok &= test_parse_flag_normalization();
  ok &= test_parse_timer_config();
  ok &= test_interval_wins_over_expiration();
  ok &= test_short_override_limited_to_half_period();
  ok &= test_long_delta_overflow_rejected();
  ok &= test_long_restart_saturates_instead_of_wrapping();
  ok &= test_short_absolute_expiration_beyond_half_period_is_stale();

  if (!ok) return 1;

  std::cout << "timer_core tests passed\n";
  return 0;
}
