#ifndef AMT_DREAM_HPP
#define AMT_DREAM_HPP

#include "dream/config.hpp"
#include "dream/log.hpp"
#include "dream/error.hpp"
#include "dream/waiter.hpp"
#include "dream/process.hpp"
#include "dream/channel.hpp"
#include "dream/task.hpp"
#include "dream/dream.hpp"
#include "dream/message.hpp"
#include "dream/stream.hpp"
#include "dream/combinators.hpp"

#endif // AMT_DREAM_HPP
