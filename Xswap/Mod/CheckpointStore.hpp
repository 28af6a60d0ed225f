#ifndef XSWAP_MOD_CHECKPOINTSTORE_HPP
#define XSWAP_MOD_CHECKPOINTSTORE_HPP

#include"Sqlite3/Db.hpp"
#include<cstdint>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Xswap { namespace Mod {

/** class Xswap::Mod::CheckpointStore
 *
 * @brief remembers, per chain, the block from which
 * event delivery must restart.
 */
class CheckpointStore {
private:
	Sqlite3::Db db;
	bool initialized;

	Ev::Io<void> init();

public:
	CheckpointStore() =delete;
	CheckpointStore(CheckpointStore const&) =delete;

	explicit
	CheckpointStore(Sqlite3::Db db_) : db(std::move(db_))
					 , initialized(false)
					 { }

	/* The stored block, 0 if the chain was never seen.  */
	Ev::Io<std::uint64_t> load(std::string chain);
	Ev::Io<void> save(std::string chain, std::uint64_t block);
};

}}

#endif /* !defined(XSWAP_MOD_CHECKPOINTSTORE_HPP) */
