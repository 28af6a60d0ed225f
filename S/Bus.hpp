#ifndef S_BUS_HPP
#define S_BUS_HPP

#include"S/Detail/Signal.hpp"
#include<memory>
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief typed publish/subscribe hub connecting the
 * modules.
 *
 * @desc Messages are routed by their exact C++ type.
 * `raise` runs every handler of that type, each in
 * its own greenthread, and completes when all have;
 * it fails if any handler failed.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	S::Detail::SignalBase* find(std::type_index) const;
	S::Detail::SignalBase& add( std::type_index
				  , std::unique_ptr<S::Detail::SignalBase>
				  );

	template<typename a>
	S::Detail::Signal<a>& signal() {
		auto type = std::type_index(typeid(a));
		auto found = find(type);
		if (!found)
			found = &add(type, std::unique_ptr<S::Detail::SignalBase>(
				new S::Detail::Signal<a>()
			));
		return static_cast<S::Detail::Signal<a>&>(*found);
	}

public:
	Bus();
	Bus(Bus&&);
	~Bus();

	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		signal<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return signal<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
