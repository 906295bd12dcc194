#ifndef FURNILYTICS_FURNILYTICS_HPP
#define FURNILYTICS_FURNILYTICS_HPP

#include "config/client_config.hpp"
#include "config/environment.hpp"
#include "http/api/catalog_api.hpp"
#include "http/api/catalog_types.hpp"
#include "http/client/curl_global.hpp"
#include "http/error/errors.hpp"
#include "table/table.hpp"

#endif
