/*==============================================================================
Thread pool

The parallel evaluator should not start one thread per point since a large 
batch would then exhaust the resources of the machine. Instead the points are
submitted as tasks to a fixed size pool of worker threads. The workers wait on
a condition variable for tasks to appear in a shared first-in-first-out queue,
and the pool is reused for all batches evaluated so that the threads are 
created only once. The objective evaluations are assumed to be of similar 
duration, and a central queue gives little contention for such workloads.

Submitting a task returns a future for the result of the task, and the caller
waits on the futures of the tasks it has submitted. Any exception thrown by a
task is stored in its future. The destructor lets the workers complete the 
queued tasks before joining them.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef DIRECT_SEARCH_THREAD_POOL
#define DIRECT_SEARCH_THREAD_POOL

#include <condition_variable>                 // Worker wake-up
#include <cstddef>                            // Standard size type
#include <functional>                         // Type erased tasks
#include <future>                             // Task results
#include <memory>                             // Shared task pointers
#include <mutex>                              // Queue protection
#include <queue>                              // The task queue
#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions
#include <thread>                             // Worker threads
#include <type_traits>                        // Result type deduction
#include <utility>                            // Perfect forwarding
#include <vector>                             // Worker storage

namespace DirectSearch
{

class ThreadPool
{
private:

  std::vector< std::thread >          Workers;
  std::queue< std::function< void() > > Tasks;
  std::mutex                          QueueLock;
  std::condition_variable             TaskAvailable;
  bool                                Stopping;

  // The worker loop waits for tasks and executes them until the pool is 
  // stopped and the queue is empty.

  void Worker( void )
  {
    while ( true )
    {
      std::function< void() > Task;

      {
        std::unique_lock< std::mutex > Lock( QueueLock );

        TaskAvailable.wait( Lock, [this](){ 
          return Stopping || !Tasks.empty(); 
        });

        if ( Stopping && Tasks.empty() ) return;

        Task = std::move( Tasks.front() );
        Tasks.pop();
      }

      Task();
    }
  }

public:

  // The task is wrapped in a packaged task to capture the result or the 
  // exception, and the packaged task is shared since the standard function 
  // requires a copyable target.

  template< class TaskFunction, 
            class ResultType = std::invoke_result_t< std::decay_t< TaskFunction > > >
  std::future< ResultType > Submit( TaskFunction && TheTask )
  {
    auto Task = std::make_shared< std::packaged_task< ResultType() > >( 
                  std::forward< TaskFunction >( TheTask ) );

    std::future< ResultType > TaskResult = Task->get_future();

    {
      std::lock_guard< std::mutex > Lock( QueueLock );

      if ( Stopping )
      {
        std::ostringstream ErrorMessage;

        ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                     << "Tasks cannot be submitted to a stopped thread pool";

        throw std::logic_error( ErrorMessage.str() );
      }

      Tasks.emplace( [Task](){ (*Task)(); } );
    }

    TaskAvailable.notify_one();
    return TaskResult;
  }

  inline std::size_t Size( void ) const
  { return Workers.size(); }

  // The constructor starts the given number of workers, which must be at 
  // least one. 

  ThreadPool( std::size_t NumberOfWorkers )
  : Workers(), Tasks(), QueueLock(), TaskAvailable(), Stopping( false )
  {
    if ( NumberOfWorkers == 0 )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "A thread pool must have at least one worker";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    Workers.reserve( NumberOfWorkers );

    for ( std::size_t i = 0; i < NumberOfWorkers; i++ )
      Workers.emplace_back( &ThreadPool::Worker, this );
  }

  ThreadPool( void ) = delete;
  ThreadPool( const ThreadPool & Other ) = delete;
  ThreadPool & operator= ( const ThreadPool & Other ) = delete;

  // The destructor signals the workers to stop and waits for them to finish
  // the remaining tasks.

  ~ThreadPool( void )
  {
    {
      std::lock_guard< std::mutex > Lock( QueueLock );
      Stopping = true;
    }

    TaskAvailable.notify_all();

    for ( std::thread & TheWorker : Workers )
      TheWorker.join();
  }
};

}      // End name space DirectSearch
#endif // DIRECT_SEARCH_THREAD_POOL
