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

template<typename _elt_t>
BoundedMsgQueue<_elt_t>::BoundedMsgQueue(size_t capacity)
    : capacity_(capacity),
      max_size_(0),
      closed_(false)
{
}

template<typename _elt_t>
BoundedMsgQueue<_elt_t>::~BoundedMsgQueue()
{
}

template<typename _elt_t>
bool BoundedMsgQueue<_elt_t>::try_push(const _elt_t& msg)
{
    std::lock_guard<std::mutex> l(lock_);

    if (closed_) {
        return false;
    }

    if (capacity_ != 0 && queue_.size() >= capacity_) {
        return false;
    }

    queue_.push_back(msg);

    if (queue_.size() > max_size_) {
        max_size_ = queue_.size();
    }

    cond_var_.notify_all();
    return true;
}

template<typename _elt_t>
bool BoundedMsgQueue<_elt_t>::try_pop(_elt_t* eltp)
{
    std::lock_guard<std::mutex> l(lock_);

    if (queue_.empty()) {
        return false;
    }

    *eltp = queue_.front();
    queue_.pop_front();

    return true;
}

template<typename _elt_t>
bool BoundedMsgQueue<_elt_t>::wait_for_millisecs(time_t millisecs)
{
    std::unique_lock<std::mutex> qlok(lock_);

    if (queue_.empty() && !closed_) {
        cond_var_.wait_for(qlok, std::chrono::milliseconds(millisecs));
    }

    return !queue_.empty();
}

template<typename _elt_t>
void BoundedMsgQueue<_elt_t>::close()
{
    std::lock_guard<std::mutex> l(lock_);

    closed_ = true;
    cond_var_.notify_all();
}

template<typename _elt_t>
void BoundedMsgQueue<_elt_t>::clear()
{
    std::lock_guard<std::mutex> l(lock_);
    queue_.clear();
}
