#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Sqlite3.hpp"
#include"Xswap/Mod/CheckpointStore.hpp"
#include<assert.h>
#include<memory>

int main() {
	auto db = Sqlite3::Db(":memory:");
	Xswap::Mod::CheckpointStore store(db);

	auto code = Ev::lift().then([&]() {
		return store.load("alpha");
	}).then([&](std::uint64_t b) {
		/* Never seen.  */
		assert(b == 0);
		return store.save("alpha", 17);
	}).then([&]() {
		return store.save("beta", 3);
	}).then([&]() {
		return store.save("alpha", 21);
	}).then([&]() {
		return store.load("alpha");
	}).then([&](std::uint64_t b) {
		assert(b == 21);
		return store.load("beta");
	}).then([&](std::uint64_t b) {
		assert(b == 3);

		/* Stored in the database, not the object.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		{
			auto q = tx.query(R"QRY(
			SELECT COUNT(*) FROM "XswapCheckpoints";
			)QRY");
			assert(q.step());
			assert(q.column_u(0) == 2);
		}
		tx.commit();

		auto again = std::make_shared<Xswap::Mod::CheckpointStore>(db);
		return again->load("alpha").then([again](std::uint64_t b) {
			return Ev::lift(b);
		});
	}).then([&](std::uint64_t b) {
		assert(b == 21);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
