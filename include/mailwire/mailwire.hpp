/*

mailwire.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <mailwire/detail/result.hpp>
#include <mailwire/detail/log.hpp>

#include <mailwire/codec/codec.hpp>
#include <mailwire/codec/base64.hpp>
#include <mailwire/codec/base64_stream.hpp>
#include <mailwire/codec/quoted_printable.hpp>
#include <mailwire/codec/word_encoder.hpp>

#include <mailwire/mime/types.hpp>
#include <mailwire/mime/mailboxes.hpp>
#include <mailwire/mime/part.hpp>
#include <mailwire/mime/file.hpp>
#include <mailwire/mime/send_error.hpp>
#include <mailwire/mime/message.hpp>
#include <mailwire/mime/writer.hpp>
#include <mailwire/mime/sendmail.hpp>

#include <mailwire/net/dialog.hpp>
#include <mailwire/net/tls_options.hpp>
#include <mailwire/net/upgradable_stream.hpp>

#include <mailwire/sasl/mechanism.hpp>
#include <mailwire/sasl/session.hpp>

#include <mailwire/smtp/types.hpp>
#include <mailwire/smtp/error_mapping.hpp>
#include <mailwire/smtp/client.hpp>
