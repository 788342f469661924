// ---- SWARM ----
// Address Documentation
/*
DOCUMENTATION:
CLASS: Address

VARIABLES:
. static constexpr size_t SIZE = 32
    - Length of a content hash reference
. static constexpr size_t ENCRYPTED_SIZE = 64
    - Length of a reference to encrypted content (hash + key)
. vector<uint8_t> bytes_
    - Backing bytes, empty for a default constructed address

CONSTRUCTOR:
. Address()
    - Empty address
. explicit Address(vector<uint8_t> bytes)
    - Takes the bytes as given

METHODS:
  Factories:
  . static Address zero()
      - 32 zero bytes, the "no address" sentinel
  . static Address from_hex(const string& hex)
      - Accepts an optional 0x prefix
      - Throws invalid_argument on odd length, bad digits or lengths other than 32/64 bytes

  Queries:
  . bool is_zero() const / bool is_empty() const
      - Distinguish the sentinel from the empty address
  . bool is_valid_reference() const
      - Neither zero nor empty
  . string to_hex() const
      - Lowercase hex without prefix
*/


// ---- ARCHIVE ----
// TarStream Documentation
/*
DOCUMENTATION:
CLASS: TarStream

VARIABLES:
. static constexpr size_t BLOCK_SIZE = 512
    - Tar block size, headers and padding align to it
. static constexpr size_t COPY_BUFFER_SIZE = 32 * 1024
    - Buffer used to drain item streams
. string buffer_
    - Archive bytes written so far
. bool closed_ / bool consumed_
    - Set by end() and take_output()
. bool in_entry_, uint64_t entry_size_, uint64_t remaining_
    - Progress of the current entry
. size_t entry_count_
    - Number of entries begun

METHODS:
Public:
  Entries:
  . void begin_file(const CollectionItem& item)
      - Finishes the previous entry, then writes a USTAR header
      - Long paths are split into prefix/name, or recorded in a PAX header
      - Sizes beyond the octal field are recorded in a PAX header
      - Throws ArchiveError on empty path or a short previous entry
  . void append_file(const char* data, size_t size)
      - Throws ArchiveError when no entry is open or the write exceeds the declared size
  . void end_file()
      - Pads the entry to BLOCK_SIZE
      - Throws ArchiveError with the number of missing bytes
  . void write_item(CollectionItem item)
      - Rejects an item without stream before writing anything
      - Copies the stream through COPY_BUFFER_SIZE chunks
      - The item's stream is destroyed when the call returns or throws

  Archive:
  . void end()
      - Finishes the current entry and appends two zero blocks
      - Every later write throws ArchiveError
  . string take_output()
      - Moves the archive bytes out, only once and only after end()

Private:
  . void write_header(name, prefix, size, typeflag)
      - Fills one header block and its checksum
  . void write_pax_header(path, size, record_path, record_size)
      - Writes an 'x' entry with path= and size= records
  . void write_padding(uint64_t size)
  . void check_open(const char* operation) const
*/


// ---- CLIENT ----
// BeeClient Documentation
/*
DOCUMENTATION:
CLASS: BeeClient (implements Client)

VARIABLES:
. const ClientOptions options_
    - Default stamp, redundancy and pin, transport limits
. const Endpoint endpoint_
    - Host, port and base path of the node
. unique_ptr<HttpTransport> transport_
    - Performs the exchanges
. atomic<NodeMode> mode_
    - FullNode until check_connection() finds a gateway proxy

CONSTRUCTOR:
. BeeClient(const string& api_url, ClientOptions options)
    - Creates a BeastTransport for the endpoint
. BeeClient(const string& api_url, ClientOptions options, unique_ptr<HttpTransport> transport)
    - Uses the given transport
    - Throws invalid_argument on a malformed URL or null transport

METHODS:
Public:
  Node:
  . bool check_connection()
      - GET / answering "Ethereum Swarm Bee\n" means full node
      - Otherwise GET /health answering "OK" means gateway proxy
      - Returns false when neither matches or the node is unreachable

  Uploads (stamp required after merging defaults):
  . upload_soc / upload_chunk
      - Succeed on 201 only
      - Send Swarm-Pin only when pinning
  . upload_blob / upload_file_bzz / upload_archive / create_feed_manifest
      - Succeed on 200 or 201

  Downloads (zero or empty address rejected):
  . download_chunk(Context&, address)
      - Cancellable, raises CancelledError
  . download_blob / download_archive / download_archive_file
      - Succeed on 200 only
      - download_archive_file reports Content-Length

  Tags:
  . create_tag / get_tag
      - Answer 0 / empty counters without a request on a gateway proxy

Private:
  . void check_status(response, accepted, operation) const
      - Throws ResponseError carrying the decoded error body
  . string require_stamp(stamp, operation) const
      - Throws PreconditionError when no stamp is left after merging
*/

// BeastTransport Documentation
/*
DOCUMENTATION:
CLASS: BeastTransport (implements HttpTransport)

VARIABLES:
. Endpoint endpoint_
. chrono::seconds timeout_
    - Deadline covering connect, write and read of one exchange
. ConnectionLimiter limiter_
    - Caps simultaneous connections, extra callers wait

METHODS:
  . HttpResponse send(HttpRequest request, const CallOptions& options)
      - Sets Host, User-Agent and Connection: close
      - Runs resolve, connect, write and read on a private io_context
      - Throws CancelledError when the context is cancelled
      - Throws TransportError on resolve, connect, I/O failure or timeout
*/


// ---- STORE ----
// PutGetter Documentation
/*
DOCUMENTATION:
CLASS: PutGetter (implements ChunkStore)

VARIABLES:
. Client& client_
. const string stamp_, redundancy_
. const bool pin_
. const uint32_t tag_
    - Created against the zero address at construction

METHODS:
  . Chunk get(Context& context, const Address& address)
      - download_chunk
  . void put(Context& context, const Chunk& chunk)
      - upload_chunk with the bound tag, stamp, redundancy and pin
*/
