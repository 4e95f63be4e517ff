#include <vil/db/level_database.hpp>
#include <vil/db/exception.hpp>

#include <fc/log/logger.hpp>

namespace vil { namespace db {

  void write_batch::put( const std::vector<char>& key, const std::vector<char>& value )
  {
     _batch.Put( ldb::Slice( key.data(), key.size() ), ldb::Slice( value.data(), value.size() ) );
     ++_count;
  }

  level_database::level_database(){}

  level_database::~level_database()
  {
     close();
  }

  void level_database::open( const fc::path& dir, bool create )
  { try {
     FC_ASSERT( !is_open(), "database at ${dir} is already open", ("dir",_path) );

     ldb::Options opts;
     opts.create_if_missing = create;

     /// \warning Given path must exist to succeed toNativeAnsiPath
     fc::create_directories( dir );

     std::string ldb_path = dir.to_native_ansi_path();

     ldb::DB* ndb = nullptr;
     auto status = ldb::DB::Open( opts, ldb_path.c_str(), &ndb );
     if( !status.ok() )
     {
         FC_THROW_EXCEPTION( level_database_open_failure, "Unable to open database ${db}\n\t${msg}",
              ("db",dir)
              ("msg",status.ToString())
              );
     }
     _db.reset( ndb );
     _path = dir;
     ilog( "opened database ${db}", ("db",dir) );
  } FC_CAPTURE_AND_RETHROW( (dir)(create) ) }

  void level_database::close()
  {
     _db.reset();
  }

  bool level_database::is_open()const
  {
     return _db != nullptr;
  }

  void level_database::set_sync_writes( bool sync )
  {
     _sync = sync;
  }

  void level_database::write( write_batch& batch )
  {
     FC_ASSERT( is_open() );
     if( batch.empty() )
        return;

     ldb::WriteOptions opts;
     opts.sync = _sync;
     auto status = _db->Write( opts, &batch._batch );
     if( !status.ok() )
     {
         FC_THROW_EXCEPTION( level_database_write_failure, "database error: ${msg}", ("msg", status.ToString() ) );
     }
  }

  void level_database::put( const std::vector<char>& key, const std::vector<char>& value )
  {
     write_batch batch;
     batch.put( key, value );
     write( batch );
  }

  fc::optional<std::string> level_database::get( const std::vector<char>& key )const
  {
     FC_ASSERT( is_open() );

     std::string value;
     auto status = _db->Get( ldb::ReadOptions(), ldb::Slice( key.data(), key.size() ), &value );
     if( status.IsNotFound() )
        return fc::optional<std::string>();
     if( !status.ok() )
     {
         FC_THROW_EXCEPTION( level_database_failure, "database error: ${msg}", ("msg", status.ToString() ) );
     }
     return value;
  }

  ldb::Iterator* level_database::new_iterator()const
  {
     FC_ASSERT( is_open() );
     return _db->NewIterator( ldb::ReadOptions() );
  }

} } // vil::db
