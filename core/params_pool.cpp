#include "params_pool.hpp"
#include <memory>
#include <utility>

namespace burrow
{
auto ParamsPool::Lease::operator=(Lease&& rhs) noexcept -> Lease&
{
	if (this != &rhs) {
		if (slot)
			pool->release(std::move(slot));
		pool = rhs.pool;
		slot = std::move(rhs.slot);
	}
	return *this;
}

ParamsPool::Lease::~Lease()
{
	if (slot)
		pool->release(std::move(slot));
}

ParamsPool::~ParamsPool()
{
	idle_slots.clear_and_dispose(std::default_delete<Slot>{});
}

auto ParamsPool::acquire() -> Lease
{
	{
		std::lock_guard<std::mutex> lock{ mtx };
		if (!idle_slots.empty()) {
			std::unique_ptr<Slot> slot{ &idle_slots.front() };
			idle_slots.pop_front();
			return Lease{ *this, std::move(slot) };
		}
	}
	return Lease{ *this, std::make_unique<Slot>(cap) };
}

auto ParamsPool::idle() const -> std::size_t
{
	std::lock_guard<std::mutex> lock{ mtx };
	return idle_slots.size();
}

auto ParamsPool::release(std::unique_ptr<Slot> slot) noexcept -> void
{
	slot->params.reset();

	std::lock_guard<std::mutex> lock{ mtx };
	idle_slots.push_front(*slot.release());
}
}
