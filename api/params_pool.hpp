#pragma once
#include "params.hpp"
#include <boost/core/noncopyable.hpp>
#include <boost/intrusive/slist.hpp>
#include <cstddef>
#include <memory>
#include <mutex>

namespace burrow
{
// Recycles parameter carriers between requests. Every carrier is created
// with the same capacity, usually Router::max_params().
class ParamsPool : boost::noncopyable
{
	// Owned by a Lease while in use, by the idle list otherwise
	struct Slot : boost::intrusive::slist_base_hook<>
	{
		explicit Slot(std::size_t capacity): params{ capacity } {}
		Slot(const Slot&) = delete;
		Slot& operator=(const Slot&) = delete;

		Params params;
	};

public:
	// Owns one carrier until destroyed, then hands it back empty
	class Lease
	{
	public:
		Lease(Lease&& rhs) noexcept = default;
		Lease& operator=(Lease&& rhs) noexcept;
		~Lease();

		auto operator*() const noexcept -> Params& { return slot->params; }
		auto operator->() const noexcept -> Params* { return &slot->params; }

	private:
		Lease(ParamsPool& pool, std::unique_ptr<Slot> slot) noexcept:
			pool{ &pool },
			slot{ std::move(slot) }
		{}

		ParamsPool* pool;
		std::unique_ptr<Slot> slot;

		friend class ParamsPool;
	};

	explicit ParamsPool(std::size_t capacity) noexcept:
		cap{ capacity }
	{}
	// Leases must not outlive the pool
	~ParamsPool();

	auto acquire() -> Lease;

	auto capacity() const noexcept -> std::size_t { return cap; }
	// carriers waiting for reuse
	auto idle() const -> std::size_t;

private:
	auto release(std::unique_ptr<Slot> slot) noexcept -> void;

	const std::size_t cap;
	mutable std::mutex mtx;
	boost::intrusive::slist<Slot> idle_slots;
};
}
