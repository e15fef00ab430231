#ifndef ROLLOUT_HPP
#define ROLLOUT_HPP

#include "rollout/core/log_common.hpp"
#include "rollout/core/log_entry.hpp"
#include "rollout/core/log_level.hpp"
#include "rollout/core/errors.hpp"
#include "rollout/core/fs_utils.hpp"
#include "rollout/core/journal_config.hpp"
#include "rollout/formatter/formatter_interface.hpp"
#include "rollout/formatter/human_readable_formatter.hpp"
#include "rollout/formatter/json_formatter.hpp"
#include "rollout/transport/transport_interface.hpp"
#include "rollout/transport/stderr_transport.hpp"
#include "rollout/sink/sink_interface.hpp"
#include "rollout/sink/console_sink.hpp"
#include "rollout/sink/callback_sink.hpp"
#include "rollout/sink/null_sink.hpp"
#include "rollout/log_manager.hpp"
#include "rollout/logger.hpp"
#include "rollout/macros.hpp"
#include "rollout/io/input_reader.hpp"
#include "rollout/journal/sequence_allocator.hpp"
#include "rollout/journal/retention_manager.hpp"
#include "rollout/journal/line_buffered_writer.hpp"
#include "rollout/journal/rotator.hpp"
#include "rollout/journal/startup_recovery.hpp"
#include "rollout/appender.hpp"
#include "rollout/cli/options.hpp"
#include "rollout/cli/run.hpp"

#endif // ROLLOUT_HPP
