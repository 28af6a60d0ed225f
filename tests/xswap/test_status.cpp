#undef NDEBUG
#include"Xswap/CrossChainSwap.hpp"
#include"Xswap/Order.hpp"
#include<assert.h>
#include<string>

int main() {
	{
		auto o = Xswap::Order();
		assert(o.status == Xswap::Order::Pending);
		assert(Xswap::advance(o, Xswap::Order::AuctionActive));
		/* Never backwards, never sideways.  */
		assert(!Xswap::advance(o, Xswap::Order::Pending));
		assert(!Xswap::advance(o, Xswap::Order::AuctionActive));
		assert(Xswap::advance(o, Xswap::Order::Executing));
		assert(Xswap::advance(o, Xswap::Order::Completed));
		assert(o.terminal());
		/* Terminal is final.  */
		assert(!Xswap::advance(o, Xswap::Order::Failed));
		assert(o.status == Xswap::Order::Completed);
		assert(std::string(Xswap::to_string(o.status)) == "completed");
	}
	{
		auto o = Xswap::Order();
		assert(Xswap::advance(o, Xswap::Order::Expired));
		assert(o.terminal());
		assert(!Xswap::advance(o, Xswap::Order::Failed));
		assert(std::string(Xswap::to_string(o.status)) == "expired");
	}
	{
		auto s = Xswap::CrossChainSwap();
		assert(s.status == Xswap::CrossChainSwap::Initiated);
		assert(!s.terminal());
		assert(Xswap::advance(s, Xswap::CrossChainSwap::SourceLocked));
		assert(Xswap::advance(s, Xswap::CrossChainSwap::DestLocked));
		assert(!Xswap::advance(s, Xswap::CrossChainSwap::SourceLocked));
		assert(Xswap::advance(s, Xswap::CrossChainSwap::Recovering));
		/* A late counterparty can still settle.  */
		assert(Xswap::advance(s, Xswap::CrossChainSwap::SecretRevealed));
		assert(Xswap::advance(s, Xswap::CrossChainSwap::Completed));
		assert(!Xswap::advance(s, Xswap::CrossChainSwap::Failed));
		assert(s.terminal());
	}
	{
		auto s = Xswap::CrossChainSwap();
		assert(Xswap::advance(s, Xswap::CrossChainSwap::SourceLocked));
		assert(Xswap::advance(s, Xswap::CrossChainSwap::Recovering));
		assert(!Xswap::advance(s, Xswap::CrossChainSwap::DestLocked));
		assert(Xswap::advance(s, Xswap::CrossChainSwap::Failed));
		assert(std::string(Xswap::to_string(s.status)) == "failed");
		assert(std::string(Xswap::to_string(s.source.state)) == "absent");
	}

	return 0;
}
