#pragma once

#include "prelude.hh"
#include "tape/transport.hh"
#include "tape/transcode.hh"
#include "tape/session.hh"
