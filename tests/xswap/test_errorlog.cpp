#undef NDEBUG
#include"Xswap/ErrorLog.hpp"
#include<assert.h>
#include<string>

int main() {
	auto log = Xswap::ErrorLog();
	assert(log.capacity() == 1000);
	assert(log.size() == 0);
	assert(log.recent(10).empty());

	log.add(1, Xswap::ErrorRecord::Error, "first", "o1", "alpha");
	log.add(2, Xswap::ErrorRecord::Warning, "second");
	assert(log.size() == 2);
	auto rs = log.recent(10);
	assert(rs.size() == 2);
	assert(rs[0].message == "first");
	assert(rs[0].order_id == "o1");
	assert(rs[0].chain == "alpha");
	assert(rs[1].message == "second");
	assert(rs[1].order_id.empty());
	assert(rs[1].level == Xswap::ErrorRecord::Warning);

	/* Never exceeds capacity; the oldest go first.  */
	for (auto i = 0; i < 1500; ++i)
		log.add(100 + i, Xswap::ErrorRecord::Info, std::to_string(i));
	assert(log.size() == 1000);
	auto all = log.all();
	assert(all.size() == 1000);
	assert(all.front().message == "500");
	assert(all.back().message == "1499");

	rs = log.recent(3);
	assert(rs.size() == 3);
	assert(rs[0].message == "1497");
	assert(rs[2].message == "1499");

	auto small = Xswap::ErrorLog(2);
	small.add(1, Xswap::ErrorRecord::Error, "a");
	small.add(2, Xswap::ErrorRecord::Error, "b");
	small.add(3, Xswap::ErrorRecord::Error, "c");
	assert(small.size() == 2);
	assert(small.all()[0].message == "b");

	assert(std::string(Xswap::to_string(Xswap::ErrorRecord::Error)) == "error");
	assert(std::string(Xswap::to_string(Xswap::ErrorRecord::Warning)) == "warning");
	assert(std::string(Xswap::to_string(Xswap::ErrorRecord::Info)) == "info");

	return 0;
}
