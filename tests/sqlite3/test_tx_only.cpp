#undef NDEBUG
/* Only the headers Sqlite3/Db.cpp itself needs.  */
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include<assert.h>
#include<string>

int main() {
	auto db = Sqlite3::Db(":memory:");

	auto code = db.transact().then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.query_execute(std::string("CREATE TABLE \"t\" (x INTEGER);"));
		tx.commit();
		assert(!tx);
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute("INSERT INTO \"t\" VALUES(1);");
		tx.commit();
		return Ev::lift(0);
	});

	return Ev::start(code);
}
