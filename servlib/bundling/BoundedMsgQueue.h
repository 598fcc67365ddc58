/*
 *    Copyright 2015 United States Government as represented by NASA
 *       Marshall Space Flight Center. All Rights Reserved.
 *
 *    Released under the NASA Open Source Software Agreement version 1.3;
 *    You may obtain a copy of the Agreement at:
 * 
 *        http://ti.arc.nasa.gov/opensource/nosa/
 * 
 *    The subject software is provided "AS IS" WITHOUT ANY WARRANTY of any kind,
 *    either expressed, implied or statutory and this agreement does not,
 *    in any manner, constitute an endorsement by government agency of any
 *    results, designs or products resulting from use of the subject software.
 *    See the Agreement for the specific language governing permissions and
 *    limitations.
 */

#ifndef _BOUNDED_MSG_QUEUE_H_
#define _BOUNDED_MSG_QUEUE_H_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace skydtn {

/**
 * A message queue with a fixed capacity. Producers never block: a
 * push onto a full (or closed) queue fails immediately. A single
 * consumer polls with try_pop and idles in wait_for_millisecs.
 */
template<typename _elt_t>
class BoundedMsgQueue {
public:
    /*!
     * Constructor. A capacity of zero means unbounded.
     */
    BoundedMsgQueue(size_t capacity);

    ~BoundedMsgQueue();

    /**
     * Atomically add msg to the back of the queue and signal a
     * waiting thread. Returns false without queueing if the queue is
     * full or closed.
     */
    bool try_push(const _elt_t& msg);

    /**
     * Try to pop a msg from the queue, but don't block. Return
     * true if there was a message on the queue, false otherwise.
     */
    bool try_pop(_elt_t* eltp);

    /**
     * Wait for up to the specified number of millisecs for a message
     * to be queued. Returns immediately if the queue is not empty or
     * has been closed. Returns true if a message is available.
     */
    bool wait_for_millisecs(time_t millisecs);

    /**
     * Refuse any further pushes and wake up the consumer. Messages
     * still queued can be popped.
     */
    void close();

    /**
     * Drop every queued message.
     */
    void clear();

    size_t size()
    {
        std::lock_guard<std::mutex> l(lock_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

    bool is_closed()
    {
        std::lock_guard<std::mutex> l(lock_);
        return closed_;
    }

    /**
     * \return High water mark of the queue.
     */
    size_t max_size()
    {
        std::lock_guard<std::mutex> l(lock_);
        return max_size_;
    }

protected:
    std::mutex              lock_;
    std::condition_variable cond_var_;

    std::deque<_elt_t>      queue_;

    const size_t            capacity_;
    size_t                  max_size_;
    bool                    closed_;
};

#include "BoundedMsgQueue.tcc"

} // namespace skydtn

#endif /* _BOUNDED_MSG_QUEUE_H_ */
