#pragma once

#include "slackpost/observability/observer.hpp"

#include <memory>

namespace slackpost::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_api_request(const std::string &method, std::chrono::milliseconds duration,
                        bool success);
void record_community_resolved(const std::string &kind, const std::string &name,
                               const std::string &id);
void record_message_posted(const std::string &destination);
void record_error(const std::string &component, const std::string &message);

} // namespace slackpost::observability
