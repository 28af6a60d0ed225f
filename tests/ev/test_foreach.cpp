#undef NDEBUG
#include"Ev/foreach.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<cstdint>
#include<memory>
#include<set>
#include<stdexcept>
#include<string>
#include<vector>

int main() {
	auto seen = std::set<std::string>();
	auto running = 0;
	auto most = 0;

	/* Each item yields a few times, so they interleave.  */
	auto visit = [&](std::string chain) {
		++running;
		if (running > most)
			most = running;
		return Ev::yield(3).then([&, chain]() {
			seen.insert(chain);
			--running;
			return Ev::lift();
		});
	};
	auto reject_dst = [&](std::string chain) {
		return Ev::yield().then([&, chain]() {
			if (chain == "dst")
				throw std::runtime_error("unreachable: " + chain);
			seen.insert(chain);
			return Ev::lift();
		});
	};

	auto code = Ev::lift().then([&]() {
		auto chains = std::vector<std::string>{"src", "dst", "third"};
		return Ev::foreach(visit, std::move(chains));
	}).then([&]() {
		assert(seen.size() == 3);
		assert(running == 0);
		assert(most > 1);

		/* One failure still lets the others finish.  */
		seen.clear();
		auto caught = std::make_shared<bool>(false);
		auto chains = std::vector<std::string>{"src", "dst", "third"};
		return Ev::foreach(reject_dst, std::move(chains)
				  ).catching<std::runtime_error
					    >([caught](std::runtime_error const& e) {
			assert(std::string(e.what()) == "unreachable: dst");
			*caught = true;
			return Ev::lift();
		}).then([caught]() {
			assert(*caught);
			return Ev::lift();
		});
	}).then([&]() {
		assert(seen.size() == 2);
		assert(seen.count("src") == 1);
		assert(seen.count("third") == 1);

		/* Results of map come back in input order.  */
		auto heights = std::vector<std::uint64_t>{7, 3, 12};
		return Ev::map([](std::uint64_t h) {
			return Ev::yield(std::size_t(h % 4)).then([h]() {
				return Ev::lift(h + 1);
			});
		}, std::move(heights));
	}).then([&](std::vector<std::uint64_t> next) {
		assert(next.size() == 3);
		assert(next[0] == 8);
		assert(next[1] == 4);
		assert(next[2] == 13);

		/* Nothing to do.  */
		seen.clear();
		return Ev::foreach(visit, std::vector<std::string>());
	}).then([&]() {
		assert(seen.empty());
		return Ev::lift(0);
	});

	return Ev::start(code);
}
