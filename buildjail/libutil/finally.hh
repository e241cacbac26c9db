#pragma once
///@file

#include <exception>
#include <utility>

/**
 * A trivial class to run a function at the end of a scope.
 */
template<typename Fn>
class [[nodiscard("Finally values must be used")]] Finally
{
private:
    Fn fun;
    bool movedFrom = false;

public:
    Finally(Fn fun) : fun(std::move(fun)) { }
    // Copying Finallys is definitely not a good idea and will cause them to be
    // called twice.
    Finally(Finally & other) = delete;
    Finally(Finally && other) : fun(std::move(other.fun))
    {
        other.movedFrom = true;
    }
    ~Finally() noexcept(false)
    {
        try {
            if (!movedFrom)
                fun();
        } catch (...) {
            // finally may only throw an exception if exception handling is not already
            // in progress. if handling *is* in progress we'll throw the cleanup error
            // away and rethrow the pending exception instead.
            if (std::uncaught_exceptions()) {
                std::rethrow_exception(std::current_exception());
            }
            throw;
        }
    }
};
