#ifndef WORKER_ID_HPP
#define WORKER_ID_HPP

#include <string>
#include <utility>

// Identity of this process in the lease table: "<host>:<random token>".
// Generated once at startup and never changed.
class WorkerId {
public:
    static WorkerId generate();

    explicit WorkerId(std::string value) : value_(std::move(value)) {}

    const std::string& str() const { return value_; }

private:
    std::string value_;

    static std::string hostName();
    static std::string randomToken();
};

#endif // WORKER_ID_HPP
