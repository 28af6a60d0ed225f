#include"Auction/rate.hpp"
#include"Htlc/Error.hpp"
#include"Htlc/Ledger.hpp"
#include"Htlc/escrow_id.hpp"
#include"Sha256/fun.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>
#include<map>
#include<set>
#include<unordered_map>

namespace Htlc {

char const* to_string(Event::Type t) {
	switch (t) {
	case Event::Created: return "EscrowCreated";
	case Event::Withdrawn: return "EscrowWithdrawn";
	case Event::Cancelled: return "EscrowCancelled";
	case Event::Unknown: return "Unknown";
	}
	return "Unknown";
}

class Ledger::Impl {
private:
	std::uint64_t chain_id;
	std::string owner;
	Params params;

	std::unordered_map<Sha256::Hash, Escrow> escrows;
	std::unordered_map<std::string, Sha256::Hash> by_order;
	/* Both directions of source <-> destination.  */
	std::unordered_map<Sha256::Hash, Sha256::Hash> links;
	std::map<std::pair<std::string, std::string>, std::uint64_t> balances;
	std::set<std::string> resolvers;

	std::uint64_t height;
	std::vector<Event> log;

	static
	std::string hex(Sha256::Hash const& h) {
		return std::string(h);
	}

	void require_owner(Context const& ctx, char const* op) const {
		if (ctx.caller != owner)
			throw_error( Unauthorized
				   , Util::Str::fmt( "%s: caller %s is not the owner"
						   , op, ctx.caller.c_str()
						   )
				   );
	}
	void validate_common( char const* op
			    , Context const& ctx
			    , Sha256::Hash const& secret_hash
			    , std::uint64_t timelock_seconds
			    , std::string const& receiver
			    , std::string const& order_id
			    , std::uint64_t amount
			    ) const {
		if (amount == 0)
			throw_error( InvalidAmount
				   , Util::Str::fmt("%s: amount must be positive", op)
				   );
		if (ctx.caller.empty() || receiver.empty())
			throw_error( InvalidAddress
				   , Util::Str::fmt("%s: empty sender or receiver", op)
				   );
		if (!secret_hash)
			throw_error( InvalidSecretHash
				   , Util::Str::fmt("%s: zero secret hash", op)
				   );
		if (order_id.empty())
			throw_error( InvalidOrderId
				   , Util::Str::fmt("%s: empty order id", op)
				   );
		if ( timelock_seconds < params.min_timelock
		  || timelock_seconds > params.max_timelock
		   )
			throw_error( TimelockOutOfRange
				   , Util::Str::fmt( "%s: timelock %llu not in [%llu, %llu]"
						   , op
						   , (unsigned long long) timelock_seconds
						   , (unsigned long long) params.min_timelock
						   , (unsigned long long) params.max_timelock
						   )
				   );
	}
	void validate_rates( char const* op
			   , std::uint64_t start_rate
			   , std::uint64_t end_rate
			   ) const {
		if (start_rate == 0 || end_rate == 0)
			throw_error( InvalidAuctionParameters
				   , Util::Str::fmt("%s: zero auction rate", op)
				   );
		if (start_rate < end_rate)
			throw_error( InvalidAuctionParameters
				   , Util::Str::fmt( "%s: start rate %llu below end rate %llu"
						   , op
						   , (unsigned long long) start_rate
						   , (unsigned long long) end_rate
						   )
				   );
	}
	void check_unused( char const* op
			 , std::string const& order_id
			 , Sha256::Hash const& id
			 ) const {
		if (by_order.count(order_id) != 0)
			throw_error( AlreadyExists
				   , Util::Str::fmt( "%s: order %s already has an escrow"
						   , op, order_id.c_str()
						   )
				   );
		if (escrows.count(id) != 0)
			throw_error( AlreadyExists
				   , Util::Str::fmt( "%s: escrow %s already exists"
						   , op, hex(id).c_str()
						   )
				   );
	}
	void check_funds( char const* op
			, std::string const& account
			, std::string const& asset
			, std::uint64_t amount
			) const {
		if (get_balance(account, asset) < amount)
			throw_error( InsufficientFunds
				   , Util::Str::fmt( "%s: %s cannot cover %llu"
						   , op, account.c_str()
						   , (unsigned long long) amount
						   )
				   );
	}
	Escrow const& existing(char const* op, Sha256::Hash const& id) const {
		auto it = escrows.find(id);
		if (it == escrows.end())
			throw_error( NotFound
				   , Util::Str::fmt( "%s: no escrow %s"
						   , op, hex(id).c_str()
						   )
				   );
		auto const& e = it->second;
		if (e.withdrawn)
			throw_error( AlreadyWithdrawn
				   , Util::Str::fmt( "%s: escrow %s already withdrawn"
						   , op, hex(id).c_str()
						   )
				   );
		if (e.cancelled)
			throw_error( AlreadyCancelled
				   , Util::Str::fmt( "%s: escrow %s already cancelled"
						   , op, hex(id).c_str()
						   )
				   );
		return e;
	}

	std::uint64_t get_balance( std::string const& account
				 , std::string const& asset
				 ) const {
		auto it = balances.find(std::make_pair(account, asset));
		if (it == balances.end())
			return 0;
		return it->second;
	}

	/* Opens the next block for a transaction and gives
	 * its hash.  */
	Sha256::Hash next_tx(Context const& ctx, char const* op, Sha256::Hash const& id) {
		++height;
		auto s = Util::Str::fmt( "%llu:%llu:%s:%s:"
				       , (unsigned long long) chain_id
				       , (unsigned long long) height
				       , ctx.caller.c_str()
				       , op
				       );
		return Sha256::fun(s + hex(id));
	}

	Event created_event(Escrow const& e, Sha256::Hash const& tx) const {
		auto ev = Event();
		ev.type = Event::Created;
		ev.escrow_id = e.escrow_id;
		ev.order_id = e.order_id;
		ev.sender = e.sender;
		ev.receiver = e.receiver;
		ev.resolver = e.resolver;
		ev.amount = e.amount;
		ev.asset = e.asset;
		ev.secret_hash = e.secret_hash;
		ev.timelock = e.timelock;
		ev.auction_start = e.auction_start;
		ev.auction_end = e.auction_end;
		ev.start_rate = e.start_rate;
		ev.end_rate = e.end_rate;
		ev.is_resolver_leg = e.is_resolver_leg;
		ev.source_escrow_id = e.source_escrow_id;
		ev.block_number = height;
		ev.tx_hash = tx;
		return ev;
	}

	Receipt insert( Context const& ctx
		      , Escrow e
		      , char const* op
		      ) {
		auto id = e.escrow_id;
		balances[std::make_pair(e.sender, e.asset)] -= e.amount;
		auto tx = next_tx(ctx, op, id);
		e.created_block = height;
		by_order[e.order_id] = id;
		if (e.is_resolver_leg) {
			links[id] = e.source_escrow_id;
			links[e.source_escrow_id] = id;
		}
		log.push_back(created_event(e, tx));
		escrows.emplace(id, std::move(e));
		return Receipt{id, height, tx};
	}

public:
	Impl( std::uint64_t chain_id_
	    , std::string owner_
	    , Params params_
	    ) : chain_id(chain_id_)
	      , owner(std::move(owner_))
	      , params(params_)
	      , height(0)
	      { }

	std::uint64_t get_chain_id() const { return chain_id; }
	std::string const& get_owner() const { return owner; }
	Params const& get_params() const { return params; }

	Receipt lock(Context const& ctx, LockArgs const& a) {
		auto op = "lock";
		validate_common( op, ctx, a.secret_hash, a.timelock_seconds
			       , a.receiver, a.order_id, a.amount
			       );
		if (a.auction_duration == 0)
			throw_error( InvalidAuctionParameters
				   , "lock: zero auction duration"
				   );
		validate_rates(op, a.start_rate, a.end_rate);

		auto timelock = ctx.now + a.timelock_seconds;
		auto id = escrow_id( ctx.caller, a.receiver, a.asset
				   , a.amount, a.secret_hash, timelock
				   , a.order_id
				   );
		check_unused(op, a.order_id, id);
		check_funds(op, ctx.caller, a.asset, a.amount);

		auto e = Escrow();
		e.escrow_id = id;
		e.sender = ctx.caller;
		e.receiver = a.receiver;
		e.resolver = a.resolver;
		e.amount = a.amount;
		e.asset = a.asset;
		e.secret_hash = a.secret_hash;
		e.timelock = timelock;
		e.withdrawn = false;
		e.cancelled = false;
		e.order_id = a.order_id;
		e.created_at = ctx.now;
		e.created_block = 0;
		e.auction_start = ctx.now;
		e.auction_end = ctx.now + a.auction_duration;
		e.start_rate = a.start_rate;
		e.end_rate = a.end_rate;
		e.is_resolver_leg = false;
		return insert(ctx, std::move(e), op);
	}

	Receipt lock_as_resolver(Context const& ctx, ResolverLockArgs const& a) {
		auto op = "lock_as_resolver";
		if (resolvers.count(ctx.caller) == 0)
			throw_error( Unauthorized
				   , Util::Str::fmt( "%s: %s is not an authorized resolver"
						   , op, ctx.caller.c_str()
						   )
				   );
		validate_common( op, ctx, a.secret_hash, a.timelock_seconds
			       , a.receiver, a.order_id, a.amount
			       );
		if (a.auction_end != a.auction_start) {
			if (a.auction_end < a.auction_start)
				throw_error( InvalidAuctionParameters
					   , "lock_as_resolver: auction ends before it starts"
					   );
			validate_rates(op, a.start_rate, a.end_rate);
		}
		if (!a.source_escrow_id)
			throw_error( InvalidSourceEscrow
				   , "lock_as_resolver: zero source escrow id"
				   );

		auto timelock = ctx.now + a.timelock_seconds;
		auto id = escrow_id( ctx.caller, a.receiver, a.asset
				   , a.amount, a.secret_hash, timelock
				   , a.order_id
				   );
		check_unused(op, a.order_id, id);
		if (links.count(a.source_escrow_id) != 0)
			throw_error( AlreadyExists
				   , Util::Str::fmt( "%s: source escrow %s already paired"
						   , op, hex(a.source_escrow_id).c_str()
						   )
				   );
		check_funds(op, ctx.caller, a.asset, a.amount);

		auto e = Escrow();
		e.escrow_id = id;
		e.sender = ctx.caller;
		e.receiver = a.receiver;
		e.resolver = ctx.caller;
		e.amount = a.amount;
		e.asset = a.asset;
		e.secret_hash = a.secret_hash;
		e.timelock = timelock;
		e.withdrawn = false;
		e.cancelled = false;
		e.order_id = a.order_id;
		e.created_at = ctx.now;
		e.created_block = 0;
		e.auction_start = a.auction_start;
		e.auction_end = a.auction_end;
		e.start_rate = a.start_rate;
		e.end_rate = a.end_rate;
		e.is_resolver_leg = true;
		e.source_escrow_id = a.source_escrow_id;
		return insert(ctx, std::move(e), op);
	}

	Receipt withdraw( Context const& ctx
			, Sha256::Hash const& id
			, std::string const& secret
			) {
		auto op = "withdraw";
		auto const& check = existing(op, id);
		if (ctx.caller != check.receiver)
			throw_error( Unauthorized
				   , Util::Str::fmt( "withdraw: caller %s is not the receiver"
						   , ctx.caller.c_str()
						   )
				   );
		if (Sha256::fun(secret) != check.secret_hash)
			throw_error( InvalidSecret
				   , Util::Str::fmt( "withdraw: secret does not match escrow %s"
						   , hex(id).c_str()
						   )
				   );

		auto& e = escrows.find(id)->second;
		auto rate = e.has_auction()
			  ? Auction::current_rate( e.start_rate, e.end_rate
						 , e.auction_start, e.auction_end
						 , ctx.now
						 )
			  : NO_AUCTION
			  ;
		e.withdrawn = true;
		balances[std::make_pair(e.receiver, e.asset)] += e.amount;

		auto tx = next_tx(ctx, op, id);
		auto ev = Event();
		ev.type = Event::Withdrawn;
		ev.escrow_id = id;
		ev.order_id = e.order_id;
		ev.sender = e.sender;
		ev.receiver = e.receiver;
		ev.amount = e.amount;
		ev.asset = e.asset;
		ev.secret_hash = e.secret_hash;
		ev.is_resolver_leg = e.is_resolver_leg;
		ev.source_escrow_id = e.source_escrow_id;
		ev.secret = secret;
		ev.execution_rate = rate;
		ev.block_number = height;
		ev.tx_hash = tx;
		log.push_back(std::move(ev));
		return Receipt{id, height, tx};
	}

	Receipt cancel(Context const& ctx, Sha256::Hash const& id) {
		auto op = "cancel";
		auto const& check = existing(op, id);
		if (ctx.caller != check.sender)
			throw_error( Unauthorized
				   , Util::Str::fmt( "cancel: caller %s is not the sender"
						   , ctx.caller.c_str()
						   )
				   );
		if (ctx.now < check.timelock)
			throw_error( TimelockNotExpired
				   , Util::Str::fmt( "cancel: timelock %llu not reached at %llu"
						   , (unsigned long long) check.timelock
						   , (unsigned long long) ctx.now
						   )
				   );

		auto& e = escrows.find(id)->second;
		e.cancelled = true;
		balances[std::make_pair(e.sender, e.asset)] += e.amount;

		auto tx = next_tx(ctx, op, id);
		auto ev = Event();
		ev.type = Event::Cancelled;
		ev.escrow_id = id;
		ev.order_id = e.order_id;
		ev.sender = e.sender;
		ev.receiver = e.receiver;
		ev.asset = e.asset;
		ev.secret_hash = e.secret_hash;
		ev.is_resolver_leg = e.is_resolver_leg;
		ev.source_escrow_id = e.source_escrow_id;
		ev.refund_amount = e.amount;
		ev.block_number = height;
		ev.tx_hash = tx;
		log.push_back(std::move(ev));
		return Receipt{id, height, tx};
	}

	std::uint64_t current_rate( std::string const& order_id
				  , std::uint64_t now
				  , bool strict
				  ) const {
		auto e = find_by_order(order_id);
		if (!e)
			throw_error( NotFound
				   , Util::Str::fmt( "current_rate: no escrow for order %s"
						   , order_id.c_str()
						   )
				   );
		if (!e->has_auction())
			return NO_AUCTION;
		if (strict && (now < e->auction_start || now > e->auction_end))
			throw_error( AuctionNotActive
				   , Util::Str::fmt( "current_rate: order %s auction not active"
						   , order_id.c_str()
						   )
				   );
		return Auction::current_rate( e->start_rate, e->end_rate
					    , e->auction_start, e->auction_end
					    , now
					    );
	}

	void set_resolver( Context const& ctx
			 , std::string const& resolver
			 , bool authorized
			 ) {
		require_owner(ctx, "set_resolver");
		if (resolver.empty())
			throw_error(InvalidAddress, "set_resolver: empty address");
		if (authorized)
			resolvers.insert(resolver);
		else
			resolvers.erase(resolver);
	}
	void deposit( Context const& ctx
		    , std::string const& account
		    , std::string const& asset
		    , std::uint64_t amount
		    ) {
		require_owner(ctx, "deposit");
		if (account.empty())
			throw_error(InvalidAddress, "deposit: empty account");
		balances[std::make_pair(account, asset)] += amount;
	}

	bool is_resolver(std::string const& account) const {
		return resolvers.count(account) != 0;
	}
	std::uint64_t balance( std::string const& account
			     , std::string const& asset
			     ) const {
		return get_balance(account, asset);
	}

	Escrow const* get(Sha256::Hash const& id) const {
		auto it = escrows.find(id);
		if (it == escrows.end())
			return nullptr;
		return &it->second;
	}
	Escrow const* find_by_order(std::string const& order_id) const {
		auto it = by_order.find(order_id);
		if (it == by_order.end())
			return nullptr;
		return get(it->second);
	}
	Sha256::Hash paired(Sha256::Hash const& id) const {
		auto it = links.find(id);
		if (it == links.end())
			return Sha256::Hash();
		return it->second;
	}

	std::uint64_t head() const { return height; }
	void advance(std::uint64_t blocks) { height += blocks; }

	std::vector<Event> events_since(std::uint64_t block) const {
		auto it = std::lower_bound( log.begin(), log.end(), block
					  , [](Event const& e, std::uint64_t b) {
			return e.block_number < b;
		});
		return std::vector<Event>(it, log.end());
	}
};

Ledger::Ledger( std::uint64_t chain_id
	      , std::string owner
	      , Params params
	      ) : pimpl(Util::make_unique<Impl>( chain_id
					       , std::move(owner)
					       , params
					       )) { }
Ledger::Ledger(Ledger&& o) : pimpl(std::move(o.pimpl)) { }
Ledger::~Ledger() { }

std::uint64_t Ledger::chain_id() const { return pimpl->get_chain_id(); }
std::string const& Ledger::owner() const { return pimpl->get_owner(); }
Params const& Ledger::params() const { return pimpl->get_params(); }

Receipt Ledger::lock(Context const& ctx, LockArgs const& args) {
	return pimpl->lock(ctx, args);
}
Receipt Ledger::lock_as_resolver(Context const& ctx, ResolverLockArgs const& args) {
	return pimpl->lock_as_resolver(ctx, args);
}
Receipt Ledger::withdraw( Context const& ctx
			, Sha256::Hash const& escrow_id
			, std::string const& secret
			) {
	return pimpl->withdraw(ctx, escrow_id, secret);
}
Receipt Ledger::cancel(Context const& ctx, Sha256::Hash const& escrow_id) {
	return pimpl->cancel(ctx, escrow_id);
}
std::uint64_t Ledger::current_rate( std::string const& order_id
				  , std::uint64_t now
				  , bool strict
				  ) const {
	return pimpl->current_rate(order_id, now, strict);
}
void Ledger::set_resolver( Context const& ctx
			 , std::string const& resolver
			 , bool authorized
			 ) {
	pimpl->set_resolver(ctx, resolver, authorized);
}
void Ledger::deposit( Context const& ctx
		    , std::string const& account
		    , std::string const& asset
		    , std::uint64_t amount
		    ) {
	pimpl->deposit(ctx, account, asset, amount);
}
bool Ledger::is_resolver(std::string const& account) const {
	return pimpl->is_resolver(account);
}
std::uint64_t Ledger::balance( std::string const& account
			     , std::string const& asset
			     ) const {
	return pimpl->balance(account, asset);
}
Escrow const* Ledger::get(Sha256::Hash const& escrow_id) const {
	return pimpl->get(escrow_id);
}
Escrow const* Ledger::find_by_order(std::string const& order_id) const {
	return pimpl->find_by_order(order_id);
}
Sha256::Hash Ledger::paired(Sha256::Hash const& escrow_id) const {
	return pimpl->paired(escrow_id);
}
std::uint64_t Ledger::head() const { return pimpl->head(); }
void Ledger::advance(std::uint64_t blocks) { pimpl->advance(blocks); }
std::vector<Event> Ledger::events_since(std::uint64_t block) const {
	return pimpl->events_since(block);
}

}
