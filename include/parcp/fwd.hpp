/**
 * @file fwd.hpp
 * @brief Forward declarations for parcp
 */

#ifndef PARCP_FWD_HPP
#define PARCP_FWD_HPP

namespace parcp {

class Copier;
class CopyStats;
class Error;
class Filesystem;
class MemFilesystem;
class Options;
class OsFilesystem;
class ReadStream;
class SeenSet;
class TreeWalker;
class WorkerPool;
class WriteStream;

struct FileInfo;
struct Job;

template <typename T> class Channel;

} // namespace parcp

#endif // PARCP_FWD_HPP
