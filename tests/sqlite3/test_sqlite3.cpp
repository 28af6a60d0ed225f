#undef NDEBUG
#include"Sqlite3.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<cstdint>
#include<stdexcept>

namespace {

std::uint64_t count_rows(Sqlite3::Tx& tx) {
	auto q = tx.query(std::string("SELECT COUNT(*) FROM \"blocks\";"));
	assert(q.step());
	return q.column_u(0);
}

}

int main() {
	auto db = Sqlite3::Db(":memory:");
	auto finished = 0;

	auto code = Ev::lift().then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.query_execute("CREATE TABLE \"blocks\" (chain TEXT PRIMARY KEY, next INTEGER NOT NULL);");
		tx.commit();
		assert(!tx);
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		{
			auto q = tx.query("INSERT INTO \"blocks\" VALUES(:chain, :next);");
			q.bind(":chain", std::string("src"))
			 .bind(":next", std::uint64_t(42))
			 ;
			assert(!q.step());
		}
		{
			auto thrown = false;
			try {
				tx.query("SELECT next FROM \"blocks\" WHERE chain = :chain;")
					.bind(":nosuch", std::string("src"));
			} catch (std::runtime_error const&) {
				thrown = true;
			}
			assert(thrown);
		}
		assert(count_rows(tx) == 1);
		tx.commit();
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		{
			auto q = tx.query("SELECT chain, next FROM \"blocks\";");
			assert(q.step());
			assert(q.column_s(0) == "src");
			assert(q.column_u(1) == 42);
			assert(!q.step());
		}
		/* Rolled back writes vanish.  */
		tx.query_execute("INSERT INTO \"blocks\" VALUES('dst', 7);");
		assert(count_rows(tx) == 2);
		tx.rollback();
		assert(!tx);
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(count_rows(tx) == 1);
		/* Not committed: dropped at destruction.  */
		tx.query_execute("INSERT INTO \"blocks\" VALUES('dst', 7);");
		return Ev::lift();
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(count_rows(tx) == 1);
		tx.commit();

		/* Concurrent transactions wait their turn.  */
		auto one = [&](std::uint64_t next) {
			return db.transact().then([&, next](Sqlite3::Tx tx) {
				{
					auto q = tx.query("UPDATE \"blocks\" SET next = :next WHERE chain = 'src';");
					q.bind(":next", next);
					assert(!q.step());
				}
				tx.commit();
				++finished;
				return Ev::lift();
			});
		};
		return Ev::concurrent(one(100))
		     + Ev::yield()
		     + Ev::concurrent(one(200))
		     + Ev::yield(10)
		     ;
	}).then([&]() {
		assert(finished == 2);
		assert(db.waiting() == 0);
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto next = std::uint64_t(0);
		{
			auto q = tx.query("SELECT next FROM \"blocks\" WHERE chain = 'src';");
			assert(q.step());
			next = q.column_u(0);
		}
		assert(next == 200);
		tx.commit();
		return Ev::lift(0);
	});

	return Ev::start(code);
}
