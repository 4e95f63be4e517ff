#pragma once
#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include <fc/filesystem.hpp>
#include <fc/optional.hpp>

#include <memory>
#include <string>
#include <vector>

namespace vil { namespace db {

  namespace ldb = leveldb;

  class level_database;

  /**
   *  @brief a set of puts that is committed to a level_database as one atomic write
   *
   *  Nothing staged in a batch is visible to readers until level_database::write()
   *  succeeds, and a failed write leaves the database untouched.
   */
  class write_batch
  {
     public:
        void put( const std::vector<char>& key, const std::vector<char>& value );

        size_t size()const { return _count; }
        bool   empty()const { return _count == 0; }

     private:
        friend class level_database;
        ldb::WriteBatch _batch;
        size_t          _count = 0;
  };

  /**
   *  @brief owns a single leveldb instance that several level_map tables share
   *
   *  Every table is addressed by a one byte prefix so that records of different
   *  types can be written together in one write_batch.
   */
  class level_database
  {
     public:
        level_database();
        ~level_database();

        void open( const fc::path& dir, bool create = true );
        void close();
        bool is_open()const;

        /** when set (the default) every write is flushed to disk before returning */
        void set_sync_writes( bool sync );
        bool sync_writes()const { return _sync; }

        void write( write_batch& batch );
        void put( const std::vector<char>& key, const std::vector<char>& value );
        fc::optional<std::string> get( const std::vector<char>& key )const;

        /** caller owns the returned iterator */
        ldb::Iterator* new_iterator()const;

        const fc::path& path()const { return _path; }

     private:
        std::unique_ptr<ldb::DB> _db;
        fc::path                 _path;
        bool                     _sync = true;
  };

} } // vil::db
