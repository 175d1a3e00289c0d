#pragma once

namespace zworkers::tests::worker::worker
{

int yields_exactly_n_results();
int failure_is_reported_and_worker_continues();
int unknown_callable_is_reported();
int lazy_source_and_iteration();
int monitor_reaches_the_callable();
int stops_while_idle();
int empty_submission_yields_nothing();

} // namespace zworkers::tests::worker::worker
