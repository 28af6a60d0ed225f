#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<map>

namespace S {

class Bus::Impl {
public:
	std::map< std::type_index
		, std::unique_ptr<S::Detail::SignalBase>
		> signals;
};

Bus::Bus() : pimpl(Util::make_unique<Impl>()) { }
Bus::Bus(Bus&& o) : pimpl(std::move(o.pimpl)) { }
Bus::~Bus() { }

S::Detail::SignalBase* Bus::find(std::type_index type) const {
	auto it = pimpl->signals.find(type);
	if (it == pimpl->signals.end())
		return nullptr;
	return it->second.get();
}
S::Detail::SignalBase& Bus::add( std::type_index type
			       , std::unique_ptr<S::Detail::SignalBase> s
			       ) {
	auto& slot = pimpl->signals[type];
	slot = std::move(s);
	return *slot;
}

}
