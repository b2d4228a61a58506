#ifndef LOKISHIP_HPP
#define LOKISHIP_HPP

#include "lokiship/core/log_common.hpp"
#include "lokiship/core/log_level.hpp"
#include "lokiship/core/log_record.hpp"
#include "lokiship/core/label_set.hpp"
#include "lokiship/core/errors.hpp"
#include "lokiship/core/endpoint.hpp"
#include "lokiship/formatter/formatter_interface.hpp"
#include "lokiship/formatter/logfmt_formatter.hpp"
#include "lokiship/formatter/json_line_formatter.hpp"
#include "lokiship/router/stream_router.hpp"
#include "lokiship/buffer/stream.hpp"
#include "lokiship/buffer/generation_buffer.hpp"
#include "lokiship/encoder/push_payload.hpp"
#include "lokiship/encoder/push_encoder.hpp"
#include "lokiship/transport/transport_interface.hpp"
#include "lokiship/transport/curl_transport.hpp"
#include "lokiship/transport/batch_sender.hpp"
#include "lokiship/shipper_options.hpp"
#include "lokiship/shipper.hpp"
#include "lokiship/shipper_builder.hpp"

#endif // LOKISHIP_HPP
