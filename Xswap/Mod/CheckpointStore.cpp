#include"Ev/Io.hpp"
#include"Sqlite3.hpp"
#include"Xswap/Mod/CheckpointStore.hpp"

namespace Xswap { namespace Mod {

Ev::Io<void> CheckpointStore::init() {
	if (initialized)
		return Ev::lift();
	return db.transact().then([this](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(
		CREATE TABLE IF NOT EXISTS "XswapCheckpoints"
		     ( chain TEXT PRIMARY KEY
		     , block INTEGER NOT NULL
		     );
		)QRY");
		tx.commit();
		initialized = true;
		return Ev::lift();
	});
}

Ev::Io<std::uint64_t> CheckpointStore::load(std::string chain) {
	return init().then([this]() {
		return db.transact();
	}).then([chain](Sqlite3::Tx tx) {
		auto block = std::uint64_t(0);
		{
			auto q = tx.query(R"QRY(
			SELECT block FROM "XswapCheckpoints"
			 WHERE chain = :chain;
			)QRY");
			q.bind(":chain", chain);
			if (q.step())
				block = q.column_u(0);
		}
		tx.commit();
		return Ev::lift(block);
	});
}

Ev::Io<void> CheckpointStore::save(std::string chain, std::uint64_t block) {
	return init().then([this]() {
		return db.transact();
	}).then([chain, block](Sqlite3::Tx tx) {
		tx.query(R"QRY(
		INSERT OR REPLACE INTO "XswapCheckpoints"
		VALUES(:chain, :block);
		)QRY")
			.bind(":chain", chain)
			.bind(":block", block)
			.step()
			;
		tx.commit();
		return Ev::lift();
	});
}

}}
