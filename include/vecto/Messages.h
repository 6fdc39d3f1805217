/** \file  Messages.h
 *  \brief Leveled diagnostic output
 *
 * Diagnostics from the library and from the programs built on it go through
 * here so that their verbosity can be controlled in one place.
 *
 * Messages::out(Messages::Debug) << "rejected sequence of length " << n << "\n";
 */

#ifndef VECTO_MESSAGES_H_INCLUDED_
#define VECTO_MESSAGES_H_INCLUDED_

#include <cstdlib>
#include <iostream>
#include <memory>

/* Pull the Messages::Type values into the Messages namespace.  With C++20
 *  this is enum class plus using enum, before that a plain enum does it.
 */
#if defined(__cpp_using_enum)
# define VECTO_ENUM enum class
# define VECTO_USING_ENUM(x) using enum x
#else
# define VECTO_ENUM enum
# define VECTO_USING_ENUM(x)
#endif

namespace Vecto { namespace Messages
{
  /** Type of messages, less severe messages have higher numbers. */
  VECTO_ENUM Type
  {
    Error = 0,        ///< Error messages
    Warning = 1,      ///< Warning messages
    Info = 2,         ///< Info messages
    Progress = 3,     ///< Progress status
    Debug = 4,        ///< Debug messages

    DefaultAbort = 0, ///< Default highest type to abort after printing
    Default = 3       ///< Default highest type to show
  };
  VECTO_USING_ENUM(Type);

  /** \brief Optional stream
   *
   * Behaves like an optional<ostream>: text streamed into it is written only
   * when the message type is within the current level.
   *
   * Once the last copy of a stream whose type is at or below the abort level
   * goes away the program exits.
   */
  class OptStream
  {
  private:
    /** Shared state of all copies of one message. */
    class Impl
    {
    public:
      Impl(bool do_output, bool do_abort, std::ostream& os) noexcept
        : os_(os), do_output_(do_output), do_abort_(do_abort)
      { }

      Impl(Impl const&) noexcept = delete;
      Impl& operator=(Impl const&) noexcept = delete;
      Impl(Impl&&) noexcept = delete;
      Impl& operator=(Impl&&) noexcept = delete;

      /** \brief Destructor.
       *
       * Exits the program if do_abort_ is set.
       */
      ~Impl() noexcept
      {
        if (do_abort_)
        {
          os_ << "ERROR: Terminating program\n";
          std::exit(2);
        }
      }

      bool do_output() const noexcept { return do_output_; }

      std::ostream& os() noexcept { return os_; }

    private:
      std::ostream& os_;    ///< Output stream
      bool do_output_;      ///< Should we do output?
      bool do_abort_;       ///< Should we abort?
    };

  public:
    /** \brief           Constructor
     *  \param do_output Output messages?
     *  \param do_abort  Abort once output is complete?
     *  \param os        Stream to output to (default stderr)
     */
    explicit OptStream(bool do_output = true, bool do_abort = true, std::ostream& os = std::cerr) noexcept
      : impl_(std::make_shared<Impl>(do_output, do_abort, os))
    { }

    /// \brief Are we doing output?
    bool do_output() const { return impl_->do_output(); }

    /// \brief Get the stream
    std::ostream& os() { return impl_->os(); }

    /** \brief       Start a message
     *  \param  type Message type
     *  \return      Stream to output to
     */
    static OptStream get(Type type)
    {
      return OptStream(type <= level_, type <= abort_level_, *stream_);
    }

    /** \brief       Set output level
     *  \param level Level
     *
     * Messages of type \a level and lower are printed, higher ones are not.
     */
    static void set_level(Type level) { level_ = level; }

    /// \brief Current output level
    static Type level() { return level_; }

    /** \brief       Set abort level
     *  \param level Level
     *
     * Messages of type \a level and lower terminate the program after
     * printing.
     */
    static void set_abort_level(Type level) { abort_level_ = level; }

    /// \brief Current abort level
    static Type abort_level() { return abort_level_; }

    /** \brief    Redirect all messages
     *  \param os Stream which outlives every message written to it
     */
    static void set_stream(std::ostream& os) { stream_ = &os; }

  private:
    static Type level_;           ///< Print level
    static Type abort_level_;     ///< Abort level
    static std::ostream* stream_; ///< Destination of all messages

    std::shared_ptr<Impl> impl_;  ///< Shared pointer to implementation
  };

  /** \brief     Output operator
   *  \param  os Stream to output to
   *  \param  t  Object to output
   *  \return    Output stream
   */
  template<typename T>
  OptStream operator<<(OptStream os, const T& t)
  {
    if (os.do_output())
    {
      os.os() << t;
    }
    return os;
  }

  /** \brief        Get the output stream
   *  \param  level Message level
   *  \return       Output stream, prefixed with the level where it has one
   */
  inline OptStream out(Type level)
  {
    OptStream os = OptStream::get(level);
    switch (level)
    {
      case Error: os << "ERROR: "; break;
      case Warning: os << "WARNING: "; break;
      case Debug: os << "DEBUG: "; break;
      default: break;
    }

    return os;
  }
}} // namespace Vecto::Messages

#endif // VECTO_MESSAGES_H_INCLUDED_
