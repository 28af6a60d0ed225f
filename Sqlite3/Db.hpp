#ifndef SQLITE3_DB_HPP
#define SQLITE3_DB_HPP

#include<cstddef>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Sqlite3 { class Query; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Db
 *
 * @brief shared handle to one SQLITE3 connection.
 *
 * @desc All access goes through `transact`, which
 * hands out one `Sqlite3::Tx` at a time; greenthreads
 * asking while a transaction is open are served in
 * the order they asked.
 * Copies refer to the same connection.
 */
class Db {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	friend class Sqlite3::Query;
	friend class Sqlite3::Tx;

	void* get_connection() const;
	void transaction_finish();

public:
	/* Opens or creates the file; ":memory:" gives a
	 * private in-memory database.  Throws
	 * std::runtime_error on failure.  */
	explicit
	Db(std::string const& filename);

	/* Invalid handle.  */
	Db() =default;
	Db(Db const&) =default;
	Db(Db&&) =default;
	Db& operator=(Db const&) =default;
	Db& operator=(Db&&) =default;
	~Db() =default;

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Ev::Io<Sqlite3::Tx> transact();

	/* Greenthreads currently waiting in `transact`.  */
	std::size_t waiting() const;
};

}

#endif /* !defined(SQLITE3_DB_HPP) */
