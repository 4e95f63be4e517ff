#pragma once
#include <fc/exception/exception.hpp>

namespace vil { namespace db {

FC_DECLARE_EXCEPTION( level_database_failure,       10000, "level_database failure" );
FC_DECLARE_EXCEPTION( level_database_open_failure,  10001, "level_database open failure" );
FC_DECLARE_EXCEPTION( level_database_write_failure, 10002, "level_database write failure" );

} } // vil::db
