#pragma once

#include "marquee/common/constants.hpp"
#include "marquee/core/error_codes.hpp"
#include "marquee/core/global_view.hpp"
#include "marquee/core/model.hpp"
#include "marquee/core/options.hpp"
#include "marquee/core/terminal_writer.hpp"
#include "marquee/core/view.hpp"
#include "marquee/core/view_stream.hpp"
#include "marquee/format/progress_format.hpp"
#include "marquee/models/models.hpp"
