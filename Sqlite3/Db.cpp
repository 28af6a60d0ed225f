#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include<deque>
#include<sqlite3.h>
#include<stdexcept>

namespace {

/* Milliseconds another process may hold the file lock.  */
auto const busy_timeout = int(5000);

}

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* connection;
	bool busy;
	std::deque<std::function<void()>> queue;

	void open_failed(char const* what) {
		auto err = connection ? std::string(sqlite3_errmsg(connection))
				      : std::string("out of memory")
				      ;
		if (connection)
			sqlite3_close_v2(connection);
		connection = nullptr;
		throw std::runtime_error(
			std::string("Sqlite3::Db: ") + what + ": " + err
		);
	}

public:
	explicit
	Impl(std::string const& filename) : connection(nullptr), busy(false) {
		auto flags = SQLITE_OPEN_READWRITE
			   | SQLITE_OPEN_CREATE
			   ;
		if (sqlite3_open_v2( filename.c_str(), &connection
				   , flags, nullptr
				   ) != SQLITE_OK)
			open_failed("open");
		if (sqlite3_extended_result_codes(connection, 1) != SQLITE_OK)
			open_failed("extended_result_codes");
		if (sqlite3_busy_timeout(connection, busy_timeout) != SQLITE_OK)
			open_failed("busy_timeout");
		/* Checkpoints are small frequent writes.  */
		if (filename != ":memory:") {
			auto res = sqlite3_exec( connection
					       , "PRAGMA journal_mode=WAL;"
					       , nullptr, nullptr, nullptr
					       );
			if (res != SQLITE_OK)
				open_failed("journal_mode");
		}
	}
	~Impl() {
		if (connection)
			sqlite3_close_v2(connection);
	}

	void* get_connection() const { return connection; }
	std::size_t waiting() const { return queue.size(); }

	Ev::Io<void> acquire() {
		return Ev::Io<void>([this]( std::function<void()> pass
					  , std::function<void(std::exception_ptr)>
					  ) {
			if (!busy) {
				busy = true;
				pass();
				return;
			}
			queue.push_back(std::move(pass));
		});
	}
	void release() {
		if (queue.empty()) {
			busy = false;
			return;
		}
		/* Ownership passes straight to the next waiter.  */
		auto next = std::move(queue.front());
		queue.pop_front();
		next();
	}
};

void* Db::get_connection() const {
	return pimpl->get_connection();
}
void Db::transaction_finish() {
	pimpl->release();
}
std::size_t Db::waiting() const {
	return pimpl->waiting();
}

Ev::Io<Sqlite3::Tx> Db::transact() {
	auto self = *this;
	return pimpl->acquire().then([]() {
		/* Do not run the new holder inside the
		 * previous holder's commit.  */
		return Ev::yield();
	}).then([self]() {
		return Ev::lift(Sqlite3::Tx(self));
	});
}

Db::Db(std::string const& filename)
	: pimpl(std::make_shared<Impl>(filename)) { }

}
