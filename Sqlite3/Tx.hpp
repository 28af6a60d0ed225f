#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Query; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief exclusive hold on the database, obtained
 * from `Sqlite3::Db::transact`, with an open BEGIN.
 *
 * @desc Move-only.  Dropping a live Tx without
 * `commit()` rolls it back and lets the next waiter
 * in.  A default-constructed Tx is invalid.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Db;

	explicit
	Tx(Sqlite3::Db const&);

public:
	Tx();
	Tx(Tx&&);
	~Tx();

	Tx& operator=(Tx&&);

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(char const*);
	Sqlite3::Query query(std::string const&);

	/* Runs parameterless statements, such as schema
	 * creation, ignoring any rows.  */
	void query_execute(char const*);
	void query_execute(std::string const& q) {
		query_execute(q.c_str());
	}

	/* Both leave the Tx invalid.  A failed COMMIT is
	 * rolled back, then thrown as std::runtime_error.  */
	void commit();
	void rollback();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
