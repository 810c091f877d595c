// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_NANOID_FORK_HANDLER_H_INCLUDED
#define HEADER_MODERN_NANOID_FORK_HANDLER_H_INCLUDED

#include <modern-nanoid/common.h>

#if __has_include(<unistd.h>)
    #include <unistd.h>
    #include <pthread.h>
    #include <signal.h>

    #define MNID_HANDLE_FORK 1

#else
    #define MNID_HANDLE_FORK 0
#endif

#include <exception>
#include <new>
#include <type_traits>

namespace mnid::impl {

#if MNID_HANDLE_FORK

    // In-place storage for an object that can be destroyed and constructed again
    template<class T>
    class recreatable {
    public:
        recreatable() = default;
        ~recreatable()
            { destroy(); }
        recreatable(const recreatable &) = delete;
        recreatable & operator=(const recreatable &) = delete;

        void recreate() {
            destroy();
            //this can throw
            new (&m_buf[0]) T;
            m_constructed = true;
        }

        T & operator*() noexcept
            { return *std::launder(reinterpret_cast<T *>(&m_buf[0])); }

    private:
        void destroy() noexcept {
            if (m_constructed) {
                (**this).~T();
                m_constructed = false;
            }
        }

    private:
        alignas(alignof(T)) uint8_t m_buf[sizeof(T)];
        bool m_constructed = false;
    };

    /**
     * Per-thread instance of T.
     *
     * The instance is constructed on first use in a thread. In a child process created by fork()
     * the instance inherited from the parent is discarded and constructed again on next use so
     * that parent and child never share state.
     */
    template<class T>
    class reset_on_fork_thread_local {
    private:
        using sig_atomic_counter = std::make_unsigned_t<sig_atomic_t>;
    public:
        static T & instance() {

            [[maybe_unused]]
            static int registered = []() {
                if (pthread_atfork(nullptr, nullptr, after_fork_in_child) != 0)
                    std::terminate();
                return 1;
            }();

            if (tl_inst.m_generation != s_generation) {
                tl_inst.m_obj.recreate();
                tl_inst.m_generation = s_generation;
            }

            return *tl_inst.m_obj;
        }
    private:
        static void after_fork_in_child() {
            //NOTE 1: only signal safe functions can be called here!
            //NOTE 2: only one thread is running here
            s_generation = s_generation + 1;
        }

        reset_on_fork_thread_local():
            m_generation(s_generation - 1)
        {}
        ~reset_on_fork_thread_local() = default;
        reset_on_fork_thread_local(const reset_on_fork_thread_local &) = delete;
        reset_on_fork_thread_local & operator=(const reset_on_fork_thread_local &) = delete;

    private:
        sig_atomic_counter m_generation;
        recreatable<T> m_obj;

        static inline volatile sig_atomic_counter s_generation = 0;
        static thread_local inline reset_on_fork_thread_local tl_inst{};
    };

#else //!MNID_HANDLE_FORK

    template<class T>
    class reset_on_fork_thread_local {
    public:
        static T & instance() {

            thread_local T obj;
            return obj;
        }
    private:
        reset_on_fork_thread_local() = delete;
        ~reset_on_fork_thread_local() = delete;
        reset_on_fork_thread_local(const reset_on_fork_thread_local &) = delete;
        reset_on_fork_thread_local & operator=(const reset_on_fork_thread_local &) = delete;
    };

#endif //MNID_HANDLE_FORK

}

#endif
