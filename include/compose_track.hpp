#ifndef COMPOSE_TRACK_HPP
#define COMPOSE_TRACK_HPP

#include "compose_track/core/common.hpp"
#include "compose_track/core/cancellation.hpp"
#include "compose_track/diag/log_entry.hpp"
#include "compose_track/diag/formatter_interface.hpp"
#include "compose_track/diag/human_readable_formatter.hpp"
#include "compose_track/diag/transport_interface.hpp"
#include "compose_track/diag/stream_transport.hpp"
#include "compose_track/diag/sink_interface.hpp"
#include "compose_track/diag/console_sink.hpp"
#include "compose_track/diag/callback_sink.hpp"
#include "compose_track/diag/logger.hpp"
#include "compose_track/diag/global.hpp"
#include "compose_track/telemetry_config.hpp"
#include "compose_track/metrics/command_set.hpp"
#include "compose_track/metrics/command_classifier.hpp"
#include "compose_track/metrics/command_record.hpp"
#include "compose_track/metrics/usage_transport.hpp"
#include "compose_track/metrics/unix_socket_transport.hpp"
#include "compose_track/metrics/usage_client.hpp"
#include "compose_track/metrics/tracker.hpp"
#include "compose_track/logs/log_consumer.hpp"
#include "compose_track/logs/filtered_log_consumer.hpp"
#include "compose_track/logs/callback_log_consumer.hpp"
#include "compose_track/logs/prefixed_log_consumer.hpp"
#include "compose_track/logs/log_backend.hpp"
#include "compose_track/logs/replay_log_backend.hpp"
#include "compose_track/logs/logs_service.hpp"

#endif // COMPOSE_TRACK_HPP
