#pragma once

#include <bisect/http/http-types.hxx>
#include <bisect/http/http-request.hxx>
#include <bisect/http/http-response.hxx>
#include <bisect/http/http-client.hxx>
