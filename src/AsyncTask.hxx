// SPDX-License-Identifier: BSD-2-Clause OR GPL-2.0-or-later

#pragma once

#include <coroutine>
#include <exception>
#include <utility>
#include <variant>

/**
 * The return type of a coroutine which produces one value of type T
 * (or an exception).  The coroutine body does not run until the task
 * is awaited or Resume() is called; when it finishes, the awaiting
 * coroutine (if any) is resumed.
 */
template<typename T>
class [[nodiscard]] AsyncTask {
public:
	class promise_type {
		std::variant<std::monostate, T, std::exception_ptr> result;

		std::coroutine_handle<> awaiter = std::noop_coroutine();

		friend AsyncTask;

		struct Finish {
			bool await_ready() const noexcept {
				return false;
			}

			std::coroutine_handle<> await_suspend(std::coroutine_handle<promise_type> h) noexcept {
				return h.promise().awaiter;
			}

			void await_resume() const noexcept {}
		};

	public:
		AsyncTask get_return_object() noexcept {
			return AsyncTask{std::coroutine_handle<promise_type>::from_promise(*this)};
		}

		std::suspend_always initial_suspend() const noexcept {
			return {};
		}

		Finish final_suspend() const noexcept {
			return {};
		}

		template<typename U>
		void return_value(U &&value) {
			result.template emplace<1>(std::forward<U>(value));
		}

		void unhandled_exception() noexcept {
			result.template emplace<2>(std::current_exception());
		}
	};

private:
	std::coroutine_handle<promise_type> handle;

	explicit AsyncTask(std::coroutine_handle<promise_type> _handle) noexcept
		:handle(_handle) {}

public:
	AsyncTask(AsyncTask &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~AsyncTask() noexcept {
		if (handle)
			handle.destroy();
	}

	AsyncTask &operator=(const AsyncTask &) = delete;

	[[gnu::pure]]
	bool IsFinished() const noexcept {
		return handle.done();
	}

	/**
	 * Run the coroutine until its first suspension point.  Only
	 * for tasks which are not awaited by another coroutine.
	 */
	void Resume() noexcept {
		handle.resume();
	}

	/**
	 * Return the value or rethrow the exception of a finished
	 * task.
	 */
	T GetResult() {
		auto &result = handle.promise().result;
		if (auto *e = std::get_if<2>(&result))
			std::rethrow_exception(*e);

		return std::move(std::get<1>(result));
	}

	bool await_ready() const noexcept {
		return false;
	}

	std::coroutine_handle<> await_suspend(std::coroutine_handle<> caller) noexcept {
		handle.promise().awaiter = caller;
		return handle;
	}

	T await_resume() {
		return GetResult();
	}
};
