/*
* Copyright (c) 2024, The Dragoman Project
*
* This file is part of Dragoman project and licensed under BSD3
*
* See full license text in LICENSE file at top of project tree
*/

#ifndef QUEUE_H__
#define QUEUE_H__

#include <list>
#include <mutex>
#include <utility>

namespace dragoman
{
namespace util
{
	/**
	 * @brief Mutex protected FIFO of pointer-like elements
	 *
	 * Get () returns a default constructed (null) element when empty.
	 */
	template<typename Element>
	class Queue
	{
		public:

			void Put (Element e)
			{
				std::unique_lock<std::mutex> l(m_QueueMutex);
				m_Queue.push_back (std::move(e));
			}

			Element Get ()
			{
				std::unique_lock<std::mutex> l(m_QueueMutex);
				if (m_Queue.empty ()) return nullptr;
				auto el = std::move (m_Queue.front ());
				m_Queue.pop_front ();
				return el;
			}

			size_t GetSize () const
			{
				std::unique_lock<std::mutex> l(m_QueueMutex);
				return m_Queue.size ();
			}

		private:

			std::list<Element> m_Queue;
			mutable std::mutex m_QueueMutex;
	};
}
}

#endif
