#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace vpl {

namespace detail {

// Shared by a signal record and the connection made for
// it. A dead signal leaves the link empty.
struct cn_link {
	std::function<void(uint32_t)> erase;
};

} // detail

// Connection to a signal. Disconnects when destroyed.
// Outliving the signal is fine.
class cn
{
public:
	cn() = default;
	cn(const cn&) = delete;
	cn(std::shared_ptr<detail::cn_link> link, uint32_t id)
		: link_{std::move(link)}
		, id_{id}
	{
	}
	cn(cn&& rhs) noexcept = default;
	~cn() {
		disconnect();
	}
	auto operator=(const cn&) -> cn& = delete;
	auto operator=(cn&& rhs) noexcept -> cn& {
		if (this == &rhs) {
			return *this;
		}
		disconnect();
		link_ = std::move(rhs.link_);
		id_ = rhs.id_;
		return *this;
	}
	auto disconnect() -> void {
		const auto link{std::move(link_)};
		if (!link || !link->erase) {
			return;
		}
		const auto erase{std::move(link->erase)};
		link->erase = {};
		erase(id_);
	}
	auto is_connected() const -> bool {
		return link_ && link_->erase;
	}
private:
	std::shared_ptr<detail::cn_link> link_;
	uint32_t id_{};
};

// Not movable. Connections capture the signal's address.
template <typename ... Args>
class signal
{
	using cb_t = std::function<void(Args...)>;
public:
	signal() = default;
	signal(const signal&) = delete;
	auto operator=(const signal&) -> signal& = delete;
	~signal() {
		for (auto& record : records_) {
			record.link->erase = {};
		}
	}
	template <typename Slot>
	[[nodiscard]] auto connect(Slot&& slot) -> cn {
		record_t record;
		record.id = next_id_++;
		record.cb = std::forward<Slot>(slot);
		record.link = std::make_shared<detail::cn_link>();
		record.link->erase = [this](uint32_t id) { erase(id); };
		records_.push_back(record);
		return cn{record.link, record.id};
	}
	auto operator()(Args... args) -> void {
		const auto ids{current_ids()};
		for (const auto id : ids) {
			const auto record{find(id)};
			if (record != records_.end()) {
				// The slot may erase its own record while running
				const auto cb{record->cb};
				cb(args...);
			}
		}
	}
	auto size() const { return records_.size(); }
	auto empty() const { return records_.empty(); }
private:
	struct record_t {
		uint32_t id{};
		std::shared_ptr<detail::cn_link> link;
		cb_t cb;
	};
	auto find(uint32_t id) -> typename std::vector<record_t>::iterator {
		return std::find_if(records_.begin(), records_.end(), [id](const record_t& record) {
			return record.id == id;
		});
	}
	auto erase(uint32_t id) -> void {
		const auto pos{find(id)};
		if (pos != records_.end()) {
			records_.erase(pos);
		}
	}
	auto current_ids() const -> std::vector<uint32_t> {
		std::vector<uint32_t> out;
		out.reserve(records_.size());
		for (const auto& record : records_) {
			out.push_back(record.id);
		}
		return out;
	}
	uint32_t next_id_{0};
	std::vector<record_t> records_;
};

} // vpl
