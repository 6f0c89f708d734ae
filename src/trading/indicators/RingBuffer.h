#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace trading::indicators
{
	/*
	RingBuffer (고정 길이 원형 버퍼)

	- 최근 N개 값만 유지, 가득 찬 상태에서 push하면 가장 오래된 값을 덮어씀
	- push는 덮어쓴 값을 돌려준다 (롤링 합/극값 갱신용)
	- at(i): 0 = oldest, size-1 = newest
	- capacity 0이면 아무것도 저장하지 않는다
	*/
	template <typename T>
	class RingBuffer final
	{
		static_assert(std::is_default_constructible_v<T>,
			"RingBuffer<T> requires a default-constructible T");

	public:
		using value_type = T;

		RingBuffer() = default;

		explicit RingBuffer(std::size_t capacity)
			: buf_(capacity), cap_(capacity) {
		}

		// 크기 변경 + 내용 비움
		void reset(std::size_t capacity) {
			buf_.assign(capacity, T{});
			cap_ = capacity;
			head_ = 0;
			size_ = 0;
		}

		void clear() noexcept {
			head_ = 0;
			size_ = 0;
		}

		[[nodiscard]] std::size_t capacity() const noexcept { return cap_; }
		[[nodiscard]] std::size_t size() const noexcept { return size_; }
		[[nodiscard]] bool empty() const noexcept { return size_ == 0; }
		[[nodiscard]] bool full() const noexcept { return cap_ != 0 && size_ == cap_; }

		std::optional<T> push(T v) {
			if (cap_ == 0)
				return std::nullopt;

			if (size_ < cap_) {
				buf_[(head_ + size_) % cap_] = std::move(v);
				++size_;
				return std::nullopt;
			}

			// 가득 참: head 자리(oldest)를 덮어쓰고 head 전진
			std::optional<T> overwritten{ std::move(buf_[head_]) };
			buf_[head_] = std::move(v);
			head_ = (head_ + 1) % cap_;
			return overwritten;
		}

		[[nodiscard]] const T& at(std::size_t index_from_oldest) const {
			if (index_from_oldest >= size_)
				throw std::out_of_range("RingBuffer::at out of range");
			return buf_[(head_ + index_from_oldest) % cap_];
		}

		[[nodiscard]] const T& newest() const {
			if (size_ == 0)
				throw std::out_of_range("RingBuffer::newest on empty buffer");
			return at(size_ - 1);
		}

		[[nodiscard]] const T& oldest() const {
			if (size_ == 0)
				throw std::out_of_range("RingBuffer::oldest on empty buffer");
			return at(0);
		}

	private:
		std::vector<T> buf_{};
		std::size_t cap_{ 0 };
		std::size_t head_{ 0 };	// oldest 물리 위치
		std::size_t size_{ 0 };
	};

} // namespace trading::indicators
