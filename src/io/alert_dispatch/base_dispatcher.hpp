#ifndef BASE_DISPATCHER_HPP
#define BASE_DISPATCHER_HPP

#include "core/alert.hpp"

#include <string>

// A sink for power alerts. Called only from the alert manager's dispatcher
// thread, one alert at a time. A false return marks a failed delivery; the
// alert is not retried.
class IAlertDispatcher {
public:
  virtual ~IAlertDispatcher() = default;
  virtual bool dispatch(const Alert &alert) = 0;
  virtual const char *get_name() const = 0;
  virtual std::string get_dispatcher_type() const = 0;
};

#endif // BASE_DISPATCHER_HPP
