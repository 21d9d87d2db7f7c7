#ifndef STENCIL_LOG_HPP
#define STENCIL_LOG_HPP

#include "stencil_log/core/log_common.hpp"
#include "stencil_log/core/log_level.hpp"
#include "stencil_log/core/field_value.hpp"
#include "stencil_log/core/log_record.hpp"
#include "stencil_log/core/encoding_error.hpp"
#include "stencil_log/formatter/formatter_interface.hpp"
#include "stencil_log/formatter/formatter_settings.hpp"
#include "stencil_log/formatter/message_template.hpp"
#include "stencil_log/formatter/plain_text_formatter.hpp"
#include "stencil_log/formatter/template_formatter.hpp"
#include "stencil_log/formatter_configuration.hpp"
#include "stencil_log/sink/sink_interface.hpp"
#include "stencil_log/sink/console_sink.hpp"
#include "stencil_log/sink/callback_sink.hpp"

#endif // STENCIL_LOG_HPP
